#include <sceau/Exception.hh>

namespace sceau
{
  Exception::Exception(elle::String const& message):
    elle::Exception(message)
  {}
}
