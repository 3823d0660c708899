#ifndef SCEAU_REGISTRY_METADATA_HH
# define SCEAU_REGISTRY_METADATA_HH

# include <string>
# include <vector>

# include <elle/Printable.hh>
# include <elle/serialization/Serializer.hh>

# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace registry
  {
    /// Someone credited for a resource, with a share of its royalties.
    struct Creator
    {
    public:
      Creator(derivation::Address address,
              bool verified,
              int share);
      Creator(elle::serialization::SerializerIn& s);
      derivation::Address address;
      bool verified;
      int share;

    public:
      void
      serialize(elle::serialization::Serializer& s);
    };

    /// The descriptive fields of a resource.
    struct Data
    {
    public:
      Data(std::string name,
           std::string symbol,
           std::string uri,
           int seller_fee_basis_points = 0,
           std::vector<Creator> creators = {});
      Data(elle::serialization::SerializerIn& s);
      std::string name;
      std::string symbol;
      std::string uri;
      int seller_fee_basis_points;
      std::vector<Creator> creators;

    public:
      void
      serialize(elle::serialization::Serializer& s);
    };

    /// The record attached to a mint by the registry.
    struct Metadata:
      public elle::Printable
    {
    public:
      Metadata(derivation::Address mint,
               derivation::Address mint_authority,
               derivation::Address update_authority,
               Data data,
               bool is_mutable);
      Metadata(elle::serialization::SerializerIn& s);
      derivation::Address mint;
      derivation::Address mint_authority;
      derivation::Address update_authority;
      Data data;
      bool is_mutable;

    public:
      void
      serialize(elle::serialization::Serializer& s);
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
