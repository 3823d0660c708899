#ifndef SCEAU_LEDGER_MINT_HH
# define SCEAU_LEDGER_MINT_HH

# include <cstdint>

# include <elle/Printable.hh>
# include <elle/serialization/Serializer.hh>

# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace ledger
  {
    /// A kind of unit: who may issue it and how many exist.
    struct Mint:
      public elle::Printable
    {
    public:
      Mint(int decimals,
           derivation::Address authority);
      Mint(elle::serialization::SerializerIn& s);
      int decimals;
      derivation::Address authority;
      uint64_t supply;

    public:
      void
      serialize(elle::serialization::Serializer& s);
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
