#include <functional>
#include <type_traits>

#include <elle/filesystem/TemporaryDirectory.hh>
#include <elle/printf.hh>
#include <elle/test.hh>

#include <sceau/AuthorizationError.hh>
#include <sceau/InvalidMetadataAccount.hh>
#include <sceau/IssuanceError.hh>
#include <sceau/derivation/InvalidSeeds.hh>
#include <sceau/derivation/derive.hh>
#include <sceau/issuance/Accounts.hh>
#include <sceau/issuance/Configuration.hh>
#include <sceau/issuance/Host.hh>
#include <sceau/issuance/Orchestrator.hh>
#include <sceau/issuance/State.hh>
#include <sceau/issuance/seeds.hh>
#include <sceau/issuance/verify.hh>
#include <sceau/storage/Collision.hh>
#include <sceau/storage/Directory.hh>
#include <sceau/storage/Journal.hh>
#include <sceau/storage/Memory.hh>

using sceau::derivation::Address;
using sceau::issuance::Accounts;
using sceau::issuance::Configuration;
using sceau::issuance::Host;
using sceau::issuance::State;

static
Address const owner(
  Address::from_string("4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T"));
static
std::string const uri("https://example.com/meta/42.json");

static_assert(!std::is_copy_constructible<Host>::value,
              "a copied host would share the original's ledger");

static
Address
other_owner()
{
  Address::Value value{};
  value.fill(7);
  return Address(value);
}

static
void
check_minted(Host const& host)
{
  auto accounts = Accounts::derive("planet-42", owner, host.configuration());
  auto mint = host.ledger().mint(accounts.mint);
  BOOST_CHECK_EQUAL(mint.decimals, 0);
  BOOST_CHECK_EQUAL(mint.supply, 1u);
  BOOST_CHECK_EQUAL(mint.authority, accounts.mint_authority);
  auto holding = host.ledger().holding(accounts.holding);
  BOOST_CHECK_EQUAL(holding.owner, owner);
  BOOST_CHECK_EQUAL(holding.mint, accounts.mint);
  BOOST_CHECK_EQUAL(holding.amount, 1u);
  auto metadata = host.registry().metadata(accounts.metadata);
  BOOST_CHECK_EQUAL(metadata.mint, accounts.mint);
  BOOST_CHECK_EQUAL(metadata.mint_authority, accounts.mint_authority);
  BOOST_CHECK_EQUAL(metadata.update_authority, accounts.mint_authority);
  BOOST_CHECK_EQUAL(metadata.data.name, "Kepler-42b");
  BOOST_CHECK_EQUAL(metadata.data.symbol, "PLANET");
  BOOST_CHECK_EQUAL(metadata.data.uri, uri);
  BOOST_CHECK_EQUAL(metadata.data.seller_fee_basis_points, 0);
  BOOST_CHECK(metadata.data.creators.empty());
  BOOST_CHECK(!metadata.is_mutable);
}

static
void
accounts()
{
  Configuration config;
  auto accounts = Accounts::derive("planet-42", owner, config);
  BOOST_CHECK_EQUAL(accounts.owner, owner);
  BOOST_CHECK_EQUAL(accounts.mint.string(),
                    "69wQLtkEapu6K8DaiozdR1rqrj6hcvF6wYsiB1Bg4AZT");
  BOOST_CHECK_EQUAL(accounts.mint_authority.string(),
                    "2i7heNxY34W4RBZaMPcVnQmF6bphq5BJJYBZ9x9nfZuK");
  BOOST_CHECK_EQUAL(accounts.metadata.string(),
                    "DDgxAy6s51kWxpNFwpDE3Rerc96ZReMT27Y3pzTHQLrV");
  BOOST_CHECK_EQUAL(accounts.registry_program, config.registry_program());
  BOOST_CHECK_THROW(Accounts::derive("", owner, config),
                    sceau::derivation::InvalidSeeds);
  BOOST_CHECK_THROW(Accounts::derive(std::string(33, 'p'), owner, config),
                    sceau::derivation::InvalidSeeds);
  BOOST_CHECK_NO_THROW(Accounts::derive(std::string(32, 'p'), owner, config));
}

static
void
end_to_end()
{
  sceau::storage::Memory storage;
  Host host(storage, Configuration());
  host.mint(owner, "planet-42", "Kepler-42b", uri);
  BOOST_CHECK_EQUAL(host.state(), State::metadata_attached);
  // Mint, holding and metadata.
  BOOST_CHECK_EQUAL(storage.size(), 3);
  check_minted(host);
}

static
void
reuse()
{
  sceau::storage::Memory storage;
  Host host(storage, Configuration());
  host.mint(owner, "planet-42", "Kepler-42b", uri);
  BOOST_CHECK_THROW(
    host.mint(owner, "planet-42", "Kepler-42b bis", "https://example.com/bis"),
    sceau::IssuanceError);
  BOOST_CHECK_EQUAL(host.state(), State::aborted);
  BOOST_CHECK_EQUAL(storage.size(), 3);
  check_minted(host);
  // Another identifier is fine.
  host.mint(owner, "planet-43", "Kepler-43c", uri);
  BOOST_CHECK_EQUAL(storage.size(), 6);
}

static
void
tampered_metadata()
{
  sceau::storage::Memory storage;
  Host host(storage, Configuration());
  auto accounts = Accounts::derive("planet-42", owner, host.configuration());
  auto other = Accounts::derive("planet-43", owner, host.configuration());
  // Deriving touches nothing.
  BOOST_CHECK_EQUAL(storage.size(), 0);
  accounts.metadata = other.metadata;
  BOOST_CHECK_THROW(host.mint(accounts, "planet-42", "Kepler-42b", uri),
                    sceau::InvalidMetadataAccount);
  BOOST_CHECK_EQUAL(host.state(), State::aborted);
  BOOST_CHECK_EQUAL(storage.size(), 0);
  // The identifier is still available.
  host.mint(owner, "planet-42", "Kepler-42b", uri);
  check_minted(host);
}

static
void
wrong_accounts()
{
  sceau::storage::Memory storage;
  Host host(storage, Configuration());
  auto honest = Accounts::derive("planet-42", owner, host.configuration());
  auto other = Accounts::derive("planet-43", owner, host.configuration());
  {
    auto accounts = honest;
    accounts.mint = other.mint;
    BOOST_CHECK_THROW(host.mint(accounts, "planet-42", "Kepler-42b", uri),
                      sceau::AuthorizationError);
  }
  {
    auto accounts = honest;
    accounts.mint_authority = other.mint_authority;
    BOOST_CHECK_THROW(host.mint(accounts, "planet-42", "Kepler-42b", uri),
                      sceau::AuthorizationError);
  }
  {
    auto accounts = honest;
    accounts.registry_program = host.configuration().program();
    BOOST_CHECK_THROW(host.mint(accounts, "planet-42", "Kepler-42b", uri),
                      sceau::AuthorizationError);
  }
  {
    auto accounts = honest;
    accounts.holding = other.holding;
    BOOST_CHECK_THROW(host.mint(accounts, "planet-42", "Kepler-42b", uri),
                      sceau::AuthorizationError);
  }
  BOOST_CHECK_EQUAL(storage.size(), 0);
}

static
void
invalid_metadata()
{
  sceau::storage::Memory storage;
  Host host(storage, Configuration());
  BOOST_CHECK_THROW(
    host.mint(owner, "planet-42", std::string(33, 'n'), uri),
    sceau::IssuanceError);
  BOOST_CHECK_THROW(
    host.mint(owner, "planet-42", "Kepler-42b", std::string(201, 'u')),
    sceau::IssuanceError);
  BOOST_CHECK_EQUAL(storage.size(), 0);
}

static
void
orchestrator()
{
  // Without a host, nothing is rolled back.
  sceau::storage::Memory storage;
  Configuration config;
  sceau::ledger::Ledger ledger(
    storage, config.ledger_program(), config.associated_program());
  sceau::registry::Registry registry(
    storage, ledger, config.registry_program());
  sceau::issuance::Orchestrator orchestrator(
    config.program(), ledger, registry);
  BOOST_CHECK_EQUAL(orchestrator.state(), State::unissued);
  BOOST_CHECK_EQUAL(orchestrator.symbol(), "PLANET");
  auto accounts = Accounts::derive("planet-42", owner, config);
  auto metadata = accounts.metadata;
  accounts.metadata =
    Accounts::derive("planet-43", owner, config).metadata;
  BOOST_CHECK_THROW(orchestrator.mint(accounts, "planet-42", "Kepler-42b", uri),
                    sceau::InvalidMetadataAccount);
  BOOST_CHECK_EQUAL(orchestrator.state(), State::aborted);
  BOOST_CHECK_EQUAL(ledger.mint(accounts.mint).supply, 1u);
  BOOST_CHECK(!storage.exist(metadata));
  BOOST_CHECK(!storage.exist(accounts.metadata));
}

static
void
directory()
{
  elle::filesystem::TemporaryDirectory tmp;
  Configuration config(tmp.path().string());
  BOOST_CHECK_EQUAL(config.home(), tmp.path());
  {
    sceau::storage::Directory storage(config.records_directory());
    Host host(storage, config);
    host.mint(owner, "planet-42", "Kepler-42b", uri);
  }
  sceau::storage::Directory storage(config.records_directory());
  Host host(storage, config);
  check_minted(host);
  BOOST_CHECK_THROW(host.mint(owner, "planet-42", "Kepler-42b", uri),
                    sceau::IssuanceError);
}

static
void
concurrent_issuance()
{
  sceau::storage::Memory storage;
  Configuration config;
  sceau::storage::Journal first(storage);
  sceau::storage::Journal second(storage);
  auto mint = [&] (sceau::storage::Journal& journal, Address const& to)
    {
      sceau::ledger::Ledger ledger(
        journal, config.ledger_program(), config.associated_program());
      sceau::registry::Registry registry(
        journal, ledger, config.registry_program());
      sceau::issuance::Orchestrator orchestrator(
        config.program(), ledger, registry);
      orchestrator.mint(Accounts::derive("planet-42", to, config),
                        "planet-42", "Kepler-42b", uri);
      BOOST_CHECK_EQUAL(orchestrator.state(), State::metadata_attached);
    };
  // Both see the identifier as free.
  mint(first, owner);
  mint(second, other_owner());
  first.commit();
  BOOST_CHECK_THROW(second.commit(), sceau::storage::Collision);
  BOOST_CHECK_EQUAL(storage.size(), 3);
  sceau::ledger::Ledger ledger(
    storage, config.ledger_program(), config.associated_program());
  auto accounts = Accounts::derive("planet-42", owner, config);
  BOOST_CHECK_EQUAL(ledger.mint(accounts.mint).supply, 1u);
  BOOST_CHECK_EQUAL(ledger.holding(accounts.holding).amount, 1u);
  BOOST_CHECK(!storage.exist(
                Accounts::derive("planet-42", other_owner(), config).holding));
}

/// Memory running a hook right before its first creation.
class Interleaved:
  public sceau::storage::Memory
{
public:
  std::function<void ()> before_create;

protected:
  void
  _create(Address const& address, elle::Buffer const& data) override
  {
    if (this->before_create)
    {
      auto hook = std::move(this->before_create);
      this->before_create = nullptr;
      hook();
    }
    if (this->_exist(address))
      throw sceau::storage::Collision(address);
    Memory::_create(address, data);
  }
};

static
void
concurrent_hosts()
{
  Interleaved storage;
  Host host(storage, Configuration());
  Host racer(storage, Configuration());
  // The racer issues planet-42 while the host commits it.
  storage.before_create = [&]
    {
      racer.mint(other_owner(), "planet-42", "Kepler-42b", uri);
    };
  BOOST_CHECK_THROW(host.mint(owner, "planet-42", "Kepler-42b", uri),
                    sceau::IssuanceError);
  BOOST_CHECK_EQUAL(host.state(), State::aborted);
  BOOST_CHECK_EQUAL(racer.state(), State::metadata_attached);
  BOOST_CHECK_EQUAL(storage.size(), 3);
  auto accounts =
    Accounts::derive("planet-42", other_owner(), host.configuration());
  BOOST_CHECK_EQUAL(host.ledger().mint(accounts.mint).supply, 1u);
  BOOST_CHECK_EQUAL(host.ledger().holding(accounts.holding).amount, 1u);
  BOOST_CHECK(!storage.exist(
                Accounts::derive("planet-42", owner, host.configuration())
                .holding));
}

static
void
verify()
{
  Configuration config;
  auto mint = Address::from_string(
    "69wQLtkEapu6K8DaiozdR1rqrj6hcvF6wYsiB1Bg4AZT");
  auto metadata = Address::from_string(
    "DDgxAy6s51kWxpNFwpDE3Rerc96ZReMT27Y3pzTHQLrV");
  BOOST_CHECK(sceau::issuance::metadata_account_valid(
                metadata, config.registry_program(), mint));
  BOOST_CHECK(!sceau::issuance::metadata_account_valid(
                mint, config.registry_program(), mint));
  BOOST_CHECK(!sceau::issuance::metadata_account_valid(
                metadata, config.program(), mint));
  BOOST_CHECK_NO_THROW(sceau::issuance::check_metadata_account(
                         metadata, config.registry_program(), mint));
  BOOST_CHECK_THROW(sceau::issuance::check_metadata_account(
                      mint, config.registry_program(), mint),
                    sceau::InvalidMetadataAccount);
}

static
void
state()
{
  BOOST_CHECK_EQUAL(elle::sprintf("%s", State::unissued), "unissued");
  BOOST_CHECK_EQUAL(elle::sprintf("%s", State::metadata_attached),
                    "metadata attached");
  BOOST_CHECK_EQUAL(elle::sprintf("%s", State::aborted), "aborted");
}

ELLE_TEST_SUITE()
{
  auto& suite = boost::unit_test::framework::master_test_suite();
  suite.add(BOOST_TEST_CASE(accounts), 0, 10);
  suite.add(BOOST_TEST_CASE(end_to_end), 0, 10);
  suite.add(BOOST_TEST_CASE(reuse), 0, 10);
  suite.add(BOOST_TEST_CASE(tampered_metadata), 0, 10);
  suite.add(BOOST_TEST_CASE(wrong_accounts), 0, 10);
  suite.add(BOOST_TEST_CASE(invalid_metadata), 0, 10);
  suite.add(BOOST_TEST_CASE(orchestrator), 0, 10);
  suite.add(BOOST_TEST_CASE(directory), 0, 10);
  suite.add(BOOST_TEST_CASE(concurrent_issuance), 0, 10);
  suite.add(BOOST_TEST_CASE(concurrent_hosts), 0, 10);
  suite.add(BOOST_TEST_CASE(verify), 0, 10);
  suite.add(BOOST_TEST_CASE(state), 0, 10);
}
