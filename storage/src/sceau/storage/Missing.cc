#include <elle/printf.hh>

#include <sceau/storage/Missing.hh>

namespace sceau
{
  namespace storage
  {
    Missing::Missing(derivation::Address const& address):
      Exception(elle::sprintf("%s holds no record", address)),
      _address(address)
    {}
  }
}
