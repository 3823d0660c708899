#ifndef SCEAU_ISSUANCE_CONFIGURATION_HH
# define SCEAU_ISSUANCE_CONFIGURATION_HH

# include <string>

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>

# include <elle/attribute.hh>

# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace issuance
  {
    /// Program ids and locations an issuance runs with.
    class Configuration
    {
    public:
      /// @param home Where records are kept, defaults to $SCEAU_HOME or
      ///             ~/.sceau.
      Configuration(boost::optional<std::string> home = {});

      /// The program resource and authority addresses are derived under.
      ELLE_ATTRIBUTE_RW(derivation::Address, program);
      /// The ledger program, part of holding derivations.
      ELLE_ATTRIBUTE_RW(derivation::Address, ledger_program);
      /// The program holding addresses are derived under.
      ELLE_ATTRIBUTE_RW(derivation::Address, associated_program);
      /// The metadata registry program.
      ELLE_ATTRIBUTE_RW(derivation::Address, registry_program);
      ELLE_ATTRIBUTE_RW(std::string, symbol);
      ELLE_ATTRIBUTE_RW(boost::filesystem::path, home);

      /// The directory holding one file per record.
      boost::filesystem::path
      records_directory() const;

    /*---------.
    | Defaults |
    `---------*/
    public:
      static std::string const default_program;
      static std::string const default_ledger_program;
      static std::string const default_associated_program;
      static std::string const default_registry_program;
      static std::string const default_symbol;
    };
  }
}

#endif
