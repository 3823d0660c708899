#ifndef SCEAU_AUTHORIZATIONERROR_HH
# define SCEAU_AUTHORIZATIONERROR_HH

# include <sceau/Exception.hh>

namespace sceau
{
  /// A derivation proof or a presented derived address was rejected.
  class AuthorizationError:
    public Exception
  {
  public:
    AuthorizationError(elle::String const& message);
  };
}

#endif
