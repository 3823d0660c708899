#include <sceau/ledger/Holding.hh>

namespace sceau
{
  namespace ledger
  {
    Holding::Holding(derivation::Address owner,
                     derivation::Address mint):
      owner(std::move(owner)),
      mint(std::move(mint)),
      amount(0)
    {}

    Holding::Holding(elle::serialization::SerializerIn& s):
      owner(),
      mint(),
      amount(0)
    {
      this->serialize(s);
    }

    void
    Holding::serialize(elle::serialization::Serializer& s)
    {
      s.serialize("owner", this->owner);
      s.serialize("mint", this->mint);
      s.serialize("amount", this->amount);
    }

    void
    Holding::print(std::ostream& stream) const
    {
      stream << "Holding(" << this->amount << " of " << this->mint
             << " for " << this->owner << ")";
    }
  }
}
