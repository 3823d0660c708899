#include <limits>

#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/AuthorizationError.hh>
#include <sceau/IssuanceError.hh>
#include <sceau/derivation/derive.hh>
#include <sceau/ledger/Ledger.hh>
#include <sceau/storage/json.hh>

ELLE_LOG_COMPONENT("sceau.ledger.Ledger");

namespace sceau
{
  namespace ledger
  {
    /*-------------.
    | Construction |
    `-------------*/

    Ledger::Ledger(storage::Storage& storage,
                   Address program,
                   Address associated_program):
      _storage(storage),
      _program(std::move(program)),
      _associated_program(std::move(associated_program))
    {}

    /*-----------.
    | Operations |
    `-----------*/

    void
    Ledger::create_mint(Address const& address,
                        int decimals,
                        Address const& authority)
    {
      ELLE_TRACE_SCOPE("%s: create mint %s with authority %s",
                       *this, address, authority);
      if (this->_storage.exist(address))
        throw IssuanceError(elle::sprintf("%s is already in use", address));
      this->_storage.store(address,
                           storage::json::encode(Mint(decimals, authority)));
    }

    Ledger::Address
    Ledger::holding_address(Address const& owner,
                            Address const& mint) const
    {
      return holding_address(
        owner, mint, this->_program, this->_associated_program);
    }

    Ledger::Address
    Ledger::holding_address(Address const& owner,
                            Address const& mint,
                            Address const& program,
                            Address const& associated_program)
    {
      derivation::Seeds seeds{
        derivation::seed(owner),
        derivation::seed(program),
        derivation::seed(mint)};
      return derivation::find(seeds, associated_program).first;
    }

    Ledger::Address
    Ledger::create_holding_account(Address const& owner,
                                   Address const& mint)
    {
      ELLE_TRACE_SCOPE("%s: create holding of %s for %s",
                       *this, mint, owner);
      // Make sure the mint exists.
      this->mint(mint);
      Address address = this->holding_address(owner, mint);
      if (this->_storage.exist(address))
        throw IssuanceError(
          elle::sprintf("holding %s is already in use", address));
      this->_storage.store(address,
                           storage::json::encode(Holding(owner, mint)));
      ELLE_DEBUG("holding created at %s", address);
      return address;
    }

    void
    Ledger::mint_to(Address const& mint,
                    Address const& holding,
                    derivation::Proof const& authority,
                    uint64_t amount)
    {
      ELLE_TRACE_SCOPE("%s: mint %s units of %s to %s as %s",
                       *this, amount, mint, holding, authority);
      Mint record = this->mint(mint);
      if (authority.address() != record.authority)
        throw AuthorizationError(
          elle::sprintf("%s is not the authority of %s",
                        authority.address(), mint));
      if (!authority.verify())
        throw AuthorizationError(
          elle::sprintf("%s does not derive %s", authority, record.authority));
      Holding account = this->holding(holding);
      if (account.mint != mint)
        throw IssuanceError(
          elle::sprintf("holding %s is for %s, not %s",
                        holding, account.mint, mint));
      if (amount > std::numeric_limits<uint64_t>::max() - record.supply)
        throw IssuanceError(elle::sprintf("supply of %s would overflow", mint));
      record.supply += amount;
      account.amount += amount;
      this->_storage.update(mint, storage::json::encode(record));
      this->_storage.update(holding, storage::json::encode(account));
      ELLE_DEBUG("%s now has a supply of %s", mint, record.supply);
    }

    /*--------.
    | Queries |
    `--------*/

    Mint
    Ledger::mint(Address const& address) const
    {
      if (!this->_storage.exist(address))
        throw IssuanceError(elle::sprintf("no mint at %s", address));
      return storage::json::decode<Mint>(this->_storage.load(address));
    }

    Holding
    Ledger::holding(Address const& address) const
    {
      if (!this->_storage.exist(address))
        throw IssuanceError(elle::sprintf("no holding at %s", address));
      return storage::json::decode<Holding>(this->_storage.load(address));
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Ledger::print(std::ostream& stream) const
    {
      stream << "Ledger(" << this->_program << ")";
    }
  }
}
