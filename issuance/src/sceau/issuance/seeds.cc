#include <sceau/derivation/InvalidSeeds.hh>
#include <sceau/issuance/seeds.hh>

namespace sceau
{
  namespace issuance
  {
    std::string const resource_tag("planet_nft");
    std::string const authority_tag("mint_authority");

    static
    derivation::Seeds
    _seeds(std::string const& tag, std::string const& identifier)
    {
      if (identifier.empty())
        throw derivation::InvalidSeeds("empty identifier");
      return derivation::Seeds{tag, identifier};
    }

    derivation::Seeds
    resource_seeds(std::string const& identifier)
    {
      return _seeds(resource_tag, identifier);
    }

    derivation::Seeds
    authority_seeds(std::string const& identifier)
    {
      return _seeds(authority_tag, identifier);
    }
  }
}
