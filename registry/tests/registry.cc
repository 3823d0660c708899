#include <limits>

#include <elle/test.hh>

#include <sceau/AuthorizationError.hh>
#include <sceau/IssuanceError.hh>
#include <sceau/derivation/derive.hh>
#include <sceau/ledger/Ledger.hh>
#include <sceau/registry/Registry.hh>
#include <sceau/storage/Memory.hh>

using sceau::derivation::Address;
using sceau::derivation::Proof;
using sceau::derivation::Seeds;
using sceau::registry::Creator;
using sceau::registry::Data;
using sceau::registry::Registry;

static
Address const program(
  Address::from_string("Fb7uNXapsRwUdsvGDedesLS7D1A4AHk6CeMvrrvTVqwf"));
static
Address const ledger_program(
  Address::from_string("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb"));
static
Address const associated_program(
  Address::from_string("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL"));
static
Address const registry_program(
  Address::from_string("metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s"));

class Fixture
{
public:
  Fixture()
    : storage()
    , ledger(storage, ledger_program, associated_program)
    , registry(storage, ledger, registry_program)
    , mint(sceau::derivation::find(Seeds{"planet_nft", "planet-42"},
                                   program).first)
    , authority(sceau::derivation::prove(Seeds{"mint_authority", "planet-42"},
                                         program))
    , metadata(Registry::metadata_address(registry_program, mint))
  {
    this->ledger.create_mint(this->mint, 0, this->authority.address());
  }

  void
  create(Data data)
  {
    this->registry.create_metadata(this->metadata,
                                   this->mint,
                                   this->authority,
                                   this->authority.address(),
                                   std::move(data),
                                   false,
                                   true);
  }

  sceau::storage::Memory storage;
  sceau::ledger::Ledger ledger;
  Registry registry;
  Address mint;
  Proof authority;
  Address metadata;
};

static
Data
kepler()
{
  return Data("Kepler-42b", "PLANET", "https://example.com/meta/42.json");
}

static
void
metadata_address()
{
  BOOST_CHECK_EQUAL(
    Registry::metadata_address(
      registry_program,
      Address::from_string("69wQLtkEapu6K8DaiozdR1rqrj6hcvF6wYsiB1Bg4AZT")),
    Address::from_string("DDgxAy6s51kWxpNFwpDE3Rerc96ZReMT27Y3pzTHQLrV"));
}

static
void
create()
{
  Fixture f;
  f.create(kepler());
  auto metadata = f.registry.metadata(f.metadata);
  BOOST_CHECK_EQUAL(metadata.mint, f.mint);
  BOOST_CHECK_EQUAL(metadata.mint_authority, f.authority.address());
  BOOST_CHECK_EQUAL(metadata.update_authority, f.authority.address());
  BOOST_CHECK_EQUAL(metadata.data.name, "Kepler-42b");
  BOOST_CHECK_EQUAL(metadata.data.symbol, "PLANET");
  BOOST_CHECK_EQUAL(metadata.data.uri, "https://example.com/meta/42.json");
  BOOST_CHECK_EQUAL(metadata.data.seller_fee_basis_points, 0);
  BOOST_CHECK(metadata.data.creators.empty());
  BOOST_CHECK(!metadata.is_mutable);
  BOOST_CHECK_THROW(f.create(kepler()), sceau::IssuanceError);
}

static
void
creators()
{
  Fixture f;
  Data data = kepler();
  data.seller_fee_basis_points = 500;
  data.creators.emplace_back(f.authority.address(), true, 60);
  data.creators.emplace_back(program, false, 40);
  f.create(std::move(data));
  auto metadata = f.registry.metadata(f.metadata);
  BOOST_CHECK_EQUAL(metadata.data.seller_fee_basis_points, 500);
  BOOST_CHECK_EQUAL(metadata.data.creators.size(), 2);
  BOOST_CHECK_EQUAL(metadata.data.creators[0].address, f.authority.address());
  BOOST_CHECK(metadata.data.creators[0].verified);
  BOOST_CHECK_EQUAL(metadata.data.creators[1].share, 40);
}

static
void
wrong_address()
{
  Fixture f;
  auto other = Registry::metadata_address(registry_program, program);
  BOOST_CHECK_THROW(
    f.registry.create_metadata(other, f.mint, f.authority,
                               f.authority.address(), kepler(), false, true),
    sceau::AuthorizationError);
  BOOST_CHECK(!f.storage.exist(other));
  BOOST_CHECK(!f.storage.exist(f.metadata));
}

static
void
wrong_authority()
{
  Fixture f;
  Proof other =
    sceau::derivation::prove(Seeds{"mint_authority", "planet-43"}, program);
  BOOST_CHECK_THROW(
    f.registry.create_metadata(f.metadata, f.mint, other,
                               other.address(), kepler(), false, true),
    sceau::AuthorizationError);
  // The update authority must sign as well.
  BOOST_CHECK_THROW(
    f.registry.create_metadata(f.metadata, f.mint, f.authority,
                               other.address(), kepler(), false, true),
    sceau::AuthorizationError);
  BOOST_CHECK(!f.storage.exist(f.metadata));
  // Unless it is not required to.
  f.registry.create_metadata(f.metadata, f.mint, f.authority,
                             other.address(), kepler(), false, false);
  BOOST_CHECK_EQUAL(f.registry.metadata(f.metadata).update_authority,
                    other.address());
}

static
void
missing_mint()
{
  Fixture f;
  Address mint =
    sceau::derivation::find(Seeds{"planet_nft", "planet-43"}, program).first;
  BOOST_CHECK_THROW(
    f.registry.create_metadata(
      Registry::metadata_address(registry_program, mint), mint, f.authority,
      f.authority.address(), kepler(), false, true),
    sceau::IssuanceError);
  BOOST_CHECK_THROW(f.registry.metadata(f.metadata), sceau::IssuanceError);
}

static
void
invalid_data()
{
  Fixture f;
  {
    Data data = kepler();
    data.name = std::string(33, 'n');
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    data.symbol = "PLANETARY11";
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    data.uri = std::string(201, 'u');
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    data.seller_fee_basis_points = 10001;
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    for (int i = 0; i < 6; ++i)
      data.creators.emplace_back(program, false, i == 0 ? 95 : 1);
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    data.creators.emplace_back(program, false, 50);
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  // Shares out of range, even adding up to 100.
  {
    Data data = kepler();
    data.creators.emplace_back(program, false, 200);
    data.creators.emplace_back(program, false, -100);
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  {
    Data data = kepler();
    data.creators.emplace_back(program, false,
                               std::numeric_limits<int>::max());
    data.creators.emplace_back(program, false, 101);
    BOOST_CHECK_THROW(f.create(std::move(data)), sceau::IssuanceError);
  }
  BOOST_CHECK(!f.storage.exist(f.metadata));
  // The limits themselves are fine.
  Data data = kepler();
  data.name = std::string(32, 'n');
  data.symbol = std::string(10, 's');
  data.uri = std::string(200, 'u');
  data.seller_fee_basis_points = 10000;
  f.create(std::move(data));
  BOOST_CHECK_EQUAL(f.registry.metadata(f.metadata).data.uri.size(), 200);
}

ELLE_TEST_SUITE()
{
  auto& suite = boost::unit_test::framework::master_test_suite();
  suite.add(BOOST_TEST_CASE(metadata_address), 0, 10);
  suite.add(BOOST_TEST_CASE(create), 0, 10);
  suite.add(BOOST_TEST_CASE(creators), 0, 10);
  suite.add(BOOST_TEST_CASE(wrong_address), 0, 10);
  suite.add(BOOST_TEST_CASE(wrong_authority), 0, 10);
  suite.add(BOOST_TEST_CASE(missing_mint), 0, 10);
  suite.add(BOOST_TEST_CASE(invalid_data), 0, 10);
}
