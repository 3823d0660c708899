#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/IssuanceError.hh>

#include <sceau/issuance/Host.hh>
#include <sceau/issuance/Orchestrator.hh>
#include <sceau/storage/Collision.hh>
#include <sceau/storage/Journal.hh>

ELLE_LOG_COMPONENT("sceau.issuance.Host");

namespace sceau
{
  namespace issuance
  {
    /*-------------.
    | Construction |
    `-------------*/

    Host::Host(storage::Storage& storage,
               Configuration configuration):
      _storage(storage),
      _configuration(std::move(configuration)),
      _ledger(storage,
              this->_configuration.ledger_program(),
              this->_configuration.associated_program()),
      _registry(storage,
                this->_ledger,
                this->_configuration.registry_program()),
      _state(State::unissued)
    {}

    /*-------------.
    | Instructions |
    `-------------*/

    void
    Host::mint(Accounts const& accounts,
               std::string const& identifier,
               std::string const& name,
               std::string const& uri)
    {
      ELLE_TRACE_SCOPE("%s: run mint of %s", *this, identifier);
      storage::Journal journal(this->_storage);
      ledger::Ledger ledger(journal,
                            this->_configuration.ledger_program(),
                            this->_configuration.associated_program());
      registry::Registry registry(journal,
                                  ledger,
                                  this->_configuration.registry_program());
      Orchestrator orchestrator(this->_configuration.program(),
                                ledger,
                                registry,
                                this->_configuration.symbol());
      try
      {
        orchestrator.mint(accounts, identifier, name, uri);
      }
      catch (...)
      {
        this->_state = orchestrator.state();
        ELLE_TRACE("%s: instruction failed, discard", *this);
        journal.discard();
        throw;
      }
      try
      {
        journal.commit();
      }
      catch (storage::Collision const& e)
      {
        this->_state = State::aborted;
        ELLE_WARN("%s: %s was issued concurrently", *this, identifier);
        throw IssuanceError(
          elle::sprintf("%s was issued concurrently: %s", identifier, e.what()));
      }
      catch (...)
      {
        this->_state = State::aborted;
        throw;
      }
      this->_state = orchestrator.state();
    }

    void
    Host::mint(derivation::Address const& owner,
               std::string const& identifier,
               std::string const& name,
               std::string const& uri)
    {
      this->mint(Accounts::derive(identifier, owner, this->_configuration),
                 identifier, name, uri);
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Host::print(std::ostream& stream) const
    {
      stream << "Host(" << this->_storage << ")";
    }
  }
}
