#include <sceau/ledger/Mint.hh>

namespace sceau
{
  namespace ledger
  {
    Mint::Mint(int decimals,
               derivation::Address authority):
      decimals(decimals),
      authority(std::move(authority)),
      supply(0)
    {}

    Mint::Mint(elle::serialization::SerializerIn& s):
      decimals(0),
      authority(),
      supply(0)
    {
      this->serialize(s);
    }

    void
    Mint::serialize(elle::serialization::Serializer& s)
    {
      s.serialize("decimals", this->decimals);
      s.serialize("authority", this->authority);
      s.serialize("supply", this->supply);
    }

    void
    Mint::print(std::ostream& stream) const
    {
      stream << "Mint(" << this->supply << " units, authority "
             << this->authority << ")";
    }
  }
}
