#ifndef SCEAU_EXCEPTION_HH
# define SCEAU_EXCEPTION_HH

# include <elle/types.hh>
# include <elle/Exception.hh>

namespace sceau
{
  /// Root of every failure reported by an issuance or one of its
  /// collaborators.
  class Exception:
    public elle::Exception
  {
    /*-------------.
    | Construction |
    `-------------*/
  public:
    Exception(elle::String const& message);
  };
}

#endif
