#include <elle/printf.hh>

#include <sceau/IssuanceError.hh>

namespace sceau
{
  IssuanceError::IssuanceError(elle::String const& message):
    Exception(elle::sprintf("issuance failed: %s", message))
  {}
}
