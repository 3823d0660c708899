#include <elle/log.hh>

#include <sceau/InvalidMetadataAccount.hh>
#include <sceau/issuance/verify.hh>
#include <sceau/registry/Registry.hh>

ELLE_LOG_COMPONENT("sceau.issuance.verify");

namespace sceau
{
  namespace issuance
  {
    bool
    metadata_account_valid(derivation::Address const& presented,
                           derivation::Address const& registry_program,
                           derivation::Address const& mint)
    {
      auto expected = registry::Registry::metadata_address(registry_program,
                                                           mint);
      ELLE_DEBUG("expected metadata address for %s: %s", mint, expected);
      return presented == expected;
    }

    void
    check_metadata_account(derivation::Address const& presented,
                           derivation::Address const& registry_program,
                           derivation::Address const& mint)
    {
      if (!metadata_account_valid(presented, registry_program, mint))
      {
        ELLE_WARN("%s is not the metadata account of %s", presented, mint);
        throw InvalidMetadataAccount();
      }
    }
  }
}
