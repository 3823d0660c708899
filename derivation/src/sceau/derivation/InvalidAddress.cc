#include <elle/printf.hh>

#include <sceau/derivation/InvalidAddress.hh>

namespace sceau
{
  namespace derivation
  {
    InvalidAddress::InvalidAddress(elle::String const& representation,
                                   elle::String const& reason):
      Exception(elle::sprintf("invalid address '%s': %s",
                              representation, reason))
    {}
  }
}
