#include <elle/printf.hh>

#include <sceau/AuthorizationError.hh>

namespace sceau
{
  AuthorizationError::AuthorizationError(elle::String const& message):
    Exception(elle::sprintf("authorization refused: %s", message))
  {}
}
