#ifndef SCEAU_ISSUANCEERROR_HH
# define SCEAU_ISSUANCEERROR_HH

# include <sceau/Exception.hh>

namespace sceau
{
  /// The ledger or the registry could not allocate or update a record.
  class IssuanceError:
    public Exception
  {
  public:
    IssuanceError(elle::String const& message);
  };
}

#endif
