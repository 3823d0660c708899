#ifndef SCEAU_STORAGE_COLLISION_HH
# define SCEAU_STORAGE_COLLISION_HH

# include <sceau/Exception.hh>
# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace storage
  {
    /// The address already holds a record.
    class Collision:
      public Exception
    {
    public:
      Collision(derivation::Address const& address);
      ELLE_ATTRIBUTE_R(derivation::Address, address);
    };
  }
}

#endif
