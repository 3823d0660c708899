#include <sceau/registry/Metadata.hh>

namespace sceau
{
  namespace registry
  {
    /*--------.
    | Creator |
    `--------*/

    Creator::Creator(derivation::Address address,
                     bool verified,
                     int share):
      address(std::move(address)),
      verified(verified),
      share(share)
    {}

    Creator::Creator(elle::serialization::SerializerIn& s):
      address(),
      verified(false),
      share(0)
    {
      this->serialize(s);
    }

    void
    Creator::serialize(elle::serialization::Serializer& s)
    {
      s.serialize("address", this->address);
      s.serialize("verified", this->verified);
      s.serialize("share", this->share);
    }

    /*-----.
    | Data |
    `-----*/

    Data::Data(std::string name,
               std::string symbol,
               std::string uri,
               int seller_fee_basis_points,
               std::vector<Creator> creators):
      name(std::move(name)),
      symbol(std::move(symbol)),
      uri(std::move(uri)),
      seller_fee_basis_points(seller_fee_basis_points),
      creators(std::move(creators))
    {}

    Data::Data(elle::serialization::SerializerIn& s):
      name(),
      symbol(),
      uri(),
      seller_fee_basis_points(0),
      creators()
    {
      this->serialize(s);
    }

    void
    Data::serialize(elle::serialization::Serializer& s)
    {
      s.serialize("name", this->name);
      s.serialize("symbol", this->symbol);
      s.serialize("uri", this->uri);
      s.serialize("seller_fee_basis_points", this->seller_fee_basis_points);
      s.serialize("creators", this->creators);
    }

    /*---------.
    | Metadata |
    `---------*/

    Metadata::Metadata(derivation::Address mint,
                       derivation::Address mint_authority,
                       derivation::Address update_authority,
                       Data data,
                       bool is_mutable):
      mint(std::move(mint)),
      mint_authority(std::move(mint_authority)),
      update_authority(std::move(update_authority)),
      data(std::move(data)),
      is_mutable(is_mutable)
    {}

    Metadata::Metadata(elle::serialization::SerializerIn& s):
      mint(),
      mint_authority(),
      update_authority(),
      data("", "", ""),
      is_mutable(false)
    {
      this->serialize(s);
    }

    void
    Metadata::serialize(elle::serialization::Serializer& s)
    {
      s.serialize("mint", this->mint);
      s.serialize("mint_authority", this->mint_authority);
      s.serialize("update_authority", this->update_authority);
      s.serialize("data", this->data);
      s.serialize("is_mutable", this->is_mutable);
    }

    void
    Metadata::print(std::ostream& stream) const
    {
      stream << "Metadata(" << this->data.name << ", " << this->data.symbol
             << ", " << this->data.uri << ")";
    }
  }
}
