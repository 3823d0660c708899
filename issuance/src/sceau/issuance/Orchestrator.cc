#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/AuthorizationError.hh>
#include <sceau/derivation/derive.hh>
#include <sceau/issuance/Orchestrator.hh>
#include <sceau/issuance/seeds.hh>
#include <sceau/issuance/verify.hh>

ELLE_LOG_COMPONENT("sceau.issuance.Orchestrator");

namespace sceau
{
  namespace issuance
  {
    /*-------------.
    | Construction |
    `-------------*/

    Orchestrator::Orchestrator(derivation::Address program,
                               ledger::Ledger& ledger,
                               registry::Registry& registry,
                               std::string symbol):
      _program(std::move(program)),
      _ledger(ledger),
      _registry(registry),
      _symbol(std::move(symbol)),
      _state(State::unissued)
    {}

    /*-----------.
    | Operations |
    `-----------*/

    void
    Orchestrator::mint(Accounts const& accounts,
                       std::string const& identifier,
                       std::string const& name,
                       std::string const& uri)
    {
      ELLE_TRACE_SCOPE("%s: mint %s with %s", *this, identifier, accounts);
      this->_state = State::unissued;
      try
      {
        ELLE_LOG("minting planet %s (%s)", name, identifier);
        ELLE_LOG("metadata uri: %s", uri);
        this->_check(accounts, identifier);
        this->_ledger.create_mint(accounts.mint, 0, accounts.mint_authority);
        this->_ledger.create_holding_account(accounts.owner, accounts.mint);
        auto authority =
          derivation::prove(authority_seeds(identifier), this->_program);
        ELLE_DEBUG("authority: %s", authority);
        this->_state = State::authorized;
        this->_ledger.mint_to(accounts.mint, accounts.holding, authority, 1);
        this->_state = State::issued;
        check_metadata_account(
          accounts.metadata, accounts.registry_program, accounts.mint);
        registry::Data data(name, this->_symbol, uri);
        this->_registry.create_metadata(accounts.metadata,
                                        accounts.mint,
                                        authority,
                                        authority.address(),
                                        std::move(data),
                                        false,
                                        true);
        this->_state = State::metadata_attached;
        ELLE_LOG("planet minted");
      }
      catch (...)
      {
        ELLE_TRACE("%s: abort from %s", *this, this->_state);
        this->_state = State::aborted;
        throw;
      }
    }

    void
    Orchestrator::_check(Accounts const& accounts,
                         std::string const& identifier) const
    {
      auto mint =
        derivation::find(resource_seeds(identifier), this->_program).first;
      if (accounts.mint != mint)
        throw AuthorizationError(
          elle::sprintf("%s is not the resource address of %s, %s is",
                        accounts.mint, identifier, mint));
      auto authority =
        derivation::find(authority_seeds(identifier), this->_program).first;
      if (accounts.mint_authority != authority)
        throw AuthorizationError(
          elle::sprintf("%s is not the authority address of %s, %s is",
                        accounts.mint_authority, identifier, authority));
      if (accounts.registry_program != this->_registry.program())
        throw AuthorizationError(
          elle::sprintf("%s is not the registry program",
                        accounts.registry_program));
      auto holding = this->_ledger.holding_address(accounts.owner, mint);
      if (accounts.holding != holding)
        throw AuthorizationError(
          elle::sprintf("%s is not the holding of %s for %s",
                        accounts.holding, accounts.owner, mint));
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Orchestrator::print(std::ostream& stream) const
    {
      stream << "Orchestrator(" << this->_program << ")";
    }
  }
}
