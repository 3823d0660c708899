#ifndef SCEAU_ISSUANCE_SEEDS_HH
# define SCEAU_ISSUANCE_SEEDS_HH

# include <string>

# include <sceau/derivation/fwd.hh>

namespace sceau
{
  namespace issuance
  {
    /// Tag of the resource (mint) addresses.
    extern std::string const resource_tag;
    /// Tag of the authority addresses.
    extern std::string const authority_tag;

    /// Throw InvalidSeeds if the identifier is empty.
    derivation::Seeds
    resource_seeds(std::string const& identifier);
    /// Throw InvalidSeeds if the identifier is empty.
    derivation::Seeds
    authority_seeds(std::string const& identifier);
  }
}

#endif
