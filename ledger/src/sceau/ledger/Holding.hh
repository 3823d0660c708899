#ifndef SCEAU_LEDGER_HOLDING_HH
# define SCEAU_LEDGER_HOLDING_HH

# include <cstdint>

# include <elle/Printable.hh>
# include <elle/serialization/Serializer.hh>

# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace ledger
  {
    /// Units of one mint held by one owner.
    struct Holding:
      public elle::Printable
    {
    public:
      Holding(derivation::Address owner,
              derivation::Address mint);
      Holding(elle::serialization::SerializerIn& s);
      derivation::Address owner;
      derivation::Address mint;
      uint64_t amount;

    public:
      void
      serialize(elle::serialization::Serializer& s);
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
