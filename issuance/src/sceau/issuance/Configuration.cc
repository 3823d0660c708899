#include <elle/log.hh>
#include <elle/os/environ.hh>
#include <elle/system/home_directory.hh>

#include <sceau/issuance/Configuration.hh>

ELLE_LOG_COMPONENT("sceau.issuance.Configuration");

namespace sceau
{
  namespace issuance
  {
    std::string const Configuration::default_program(
      "Fb7uNXapsRwUdsvGDedesLS7D1A4AHk6CeMvrrvTVqwf");
    std::string const Configuration::default_ledger_program(
      "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb");
    std::string const Configuration::default_associated_program(
      "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
    std::string const Configuration::default_registry_program(
      "metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s");
    std::string const Configuration::default_symbol("PLANET");

    static
    boost::filesystem::path
    default_home()
    {
      return elle::os::getenv(
        "SCEAU_HOME",
        (elle::system::home_directory() / ".sceau").string());
    }

    Configuration::Configuration(boost::optional<std::string> home):
      _program(derivation::Address::from_string(default_program)),
      _ledger_program(derivation::Address::from_string(default_ledger_program)),
      _associated_program(
        derivation::Address::from_string(default_associated_program)),
      _registry_program(
        derivation::Address::from_string(default_registry_program)),
      _symbol(default_symbol),
      _home(home && !home->empty() ? boost::filesystem::path(*home)
                                   : default_home())
    {
      ELLE_DEBUG("home: %s", this->_home.string());
    }

    boost::filesystem::path
    Configuration::records_directory() const
    {
      return this->_home / "records";
    }
  }
}
