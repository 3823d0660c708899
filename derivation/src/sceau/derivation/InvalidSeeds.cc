#include <elle/printf.hh>

#include <sceau/derivation/InvalidSeeds.hh>

namespace sceau
{
  namespace derivation
  {
    InvalidSeeds::InvalidSeeds(elle::String const& message):
      Exception(elle::sprintf("invalid seeds: %s", message))
    {}
  }
}
