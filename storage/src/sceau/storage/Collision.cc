#include <elle/printf.hh>

#include <sceau/storage/Collision.hh>

namespace sceau
{
  namespace storage
  {
    Collision::Collision(derivation::Address const& address):
      Exception(elle::sprintf("%s already holds a record", address)),
      _address(address)
    {}
  }
}
