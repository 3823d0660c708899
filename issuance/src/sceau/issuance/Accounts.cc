#include <sceau/derivation/derive.hh>
#include <sceau/issuance/Accounts.hh>
#include <sceau/issuance/seeds.hh>
#include <sceau/ledger/Ledger.hh>
#include <sceau/registry/Registry.hh>

namespace sceau
{
  namespace issuance
  {
    Accounts
    Accounts::derive(std::string const& identifier,
                     derivation::Address const& owner,
                     Configuration const& configuration)
    {
      Accounts res;
      res.owner = owner;
      res.mint =
        derivation::find(resource_seeds(identifier),
                         configuration.program()).first;
      res.mint_authority =
        derivation::find(authority_seeds(identifier),
                         configuration.program()).first;
      res.holding = ledger::Ledger::holding_address(
        owner,
        res.mint,
        configuration.ledger_program(),
        configuration.associated_program());
      res.registry_program = configuration.registry_program();
      res.metadata = registry::Registry::metadata_address(
        res.registry_program, res.mint);
      return res;
    }

    void
    Accounts::print(std::ostream& stream) const
    {
      stream << "Accounts(mint " << this->mint
             << ", authority " << this->mint_authority
             << ", metadata " << this->metadata << ")";
    }
  }
}
