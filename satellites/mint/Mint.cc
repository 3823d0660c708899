#include <iostream>
#include <string>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <elle/Exception.hh>
#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/derivation/derive.hh>
#include <sceau/issuance/Accounts.hh>
#include <sceau/issuance/Configuration.hh>
#include <sceau/issuance/Host.hh>
#include <sceau/issuance/seeds.hh>
#include <sceau/registry/Registry.hh>
#include <sceau/storage/Directory.hh>

#include <satellites/satellite.hh>

ELLE_LOG_COMPONENT("sceau.satellites.mint.Mint");

using sceau::derivation::Address;

static
void
mandatory(boost::program_options::variables_map const& options,
          std::string const& option)
{
  if (!options.count(option))
    throw elle::Exception(
      elle::sprintf("missing mandatory option: %s", option));
}

static
boost::program_options::variables_map
parse_options(int argc, char** argv)
{
  using namespace boost::program_options;
  options_description options("Allowed options");
  options.add_options()
    ("help,h", "display the help")
    ("identifier,i", value<std::string>(), "the planet identifier")
    ("name,n", value<std::string>(), "the planet display name")
    ("uri,u", value<std::string>(), "the metadata uri")
    ("owner,o", value<std::string>(), "the owner address, in base58")
    ("metadata,m", value<std::string>(),
     "the metadata address to present, derived if absent")
    ("derive,d", "print the derived addresses and exit")
    ("show,s", "print the stored records and exit")
    ("home", value<std::string>(), "where records are kept")
    ("program", value<std::string>(), "the issuance program id")
    ("ledger-program", value<std::string>(), "the ledger program id")
    ("associated-program", value<std::string>(),
     "the program holding addresses are derived under")
    ("registry-program", value<std::string>(), "the registry program id");

  variables_map vm;
  try
  {
    store(parse_command_line(argc, argv, options), vm);
    notify(vm);
  }
  catch (error const& e)
  {
    throw elle::Exception(elle::sprintf("command line error: %s", e.what()));
  }

  if (vm.count("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << options;
    std::cout << std::endl;
    throw sceau::Exit(0);
  }

  mandatory(vm, "identifier");
  if (!vm.count("derive") && !vm.count("show"))
  {
    mandatory(vm, "name");
    mandatory(vm, "uri");
    mandatory(vm, "owner");
  }

  return vm;
}

static
sceau::issuance::Configuration
configuration(boost::program_options::variables_map const& options)
{
  boost::optional<std::string> home;
  if (options.count("home"))
    home = options["home"].as<std::string>();
  sceau::issuance::Configuration res(home);
  if (options.count("program"))
    res.program(Address::from_string(options["program"].as<std::string>()));
  if (options.count("ledger-program"))
    res.ledger_program(
      Address::from_string(options["ledger-program"].as<std::string>()));
  if (options.count("associated-program"))
    res.associated_program(
      Address::from_string(options["associated-program"].as<std::string>()));
  if (options.count("registry-program"))
    res.registry_program(
      Address::from_string(options["registry-program"].as<std::string>()));
  return res;
}

static
void
derive(std::string const& identifier,
       boost::optional<Address> const& owner,
       sceau::issuance::Configuration const& config)
{
  auto mint = sceau::derivation::find(
    sceau::issuance::resource_seeds(identifier), config.program());
  auto authority = sceau::derivation::find(
    sceau::issuance::authority_seeds(identifier), config.program());
  std::cout << "mint: " << mint.first
            << " (nonce " << static_cast<unsigned int>(mint.second) << ")"
            << std::endl;
  std::cout << "mint authority: " << authority.first
            << " (nonce " << static_cast<unsigned int>(authority.second) << ")"
            << std::endl;
  std::cout << "metadata: "
            << sceau::registry::Registry::metadata_address(
              config.registry_program(), mint.first)
            << std::endl;
  if (owner)
    std::cout << "holding: "
              << sceau::issuance::Accounts::derive(
                identifier, owner.get(), config).holding
              << std::endl;
}

static
void
show(sceau::issuance::Host const& host,
     std::string const& identifier,
     boost::optional<Address> const& owner)
{
  auto accounts = sceau::issuance::Accounts::derive(
    identifier, owner ? owner.get() : Address(), host.configuration());
  std::cout << host.ledger().mint(accounts.mint) << std::endl;
  if (owner)
    std::cout << host.ledger().holding(accounts.holding) << std::endl;
  auto metadata = host.registry().metadata(accounts.metadata);
  std::cout << metadata << std::endl;
  std::cout << "  seller fee: " << metadata.data.seller_fee_basis_points
            << " basis points, "
            << (metadata.is_mutable ? "mutable" : "immutable") << std::endl;
}

int
main(int argc, char** argv)
{
  return sceau::satellite_main("sceau-mint", [&]
  {
    auto options = parse_options(argc, argv);
    auto config = configuration(options);
    std::string const identifier = options["identifier"].as<std::string>();
    boost::optional<Address> owner;
    if (options.count("owner"))
      owner = Address::from_string(options["owner"].as<std::string>());
    if (options.count("derive"))
    {
      derive(identifier, owner, config);
      return;
    }
    sceau::storage::Directory storage(config.records_directory());
    sceau::issuance::Host host(storage, config);
    if (options.count("show"))
    {
      show(host, identifier, owner);
      return;
    }
    auto accounts =
      sceau::issuance::Accounts::derive(identifier, owner.get(), config);
    if (options.count("metadata"))
      accounts.metadata =
        Address::from_string(options["metadata"].as<std::string>());
    ELLE_TRACE("present %s", accounts);
    host.mint(accounts,
              identifier,
              options["name"].as<std::string>(),
              options["uri"].as<std::string>());
    std::cout << "minted " << accounts.mint << std::endl;
  });
}
