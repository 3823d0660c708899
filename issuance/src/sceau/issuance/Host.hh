#ifndef SCEAU_ISSUANCE_HOST_HH
# define SCEAU_ISSUANCE_HOST_HH

# include <string>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <sceau/issuance/Accounts.hh>
# include <sceau/issuance/Configuration.hh>
# include <sceau/issuance/State.hh>
# include <sceau/ledger/Ledger.hh>
# include <sceau/registry/Registry.hh>
# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace issuance
  {
    /// Run mint instructions atomically over some storage.
    ///
    /// Each instruction writes to a fresh journal on top of the storage,
    /// committed if the instruction succeeds and discarded otherwise.  If
    /// another writer issued the same identifier meanwhile, the commit
    /// writes nothing and the instruction fails with IssuanceError.
    class Host:
      public elle::Printable
    {
    /*-------------.
    | Construction |
    `-------------*/
    public:
      Host(storage::Storage& storage,
           Configuration configuration);
      /// The registry refers to the ledger of the same host.
      Host(Host const&) = delete;
      Host&
      operator =(Host const&) = delete;
      ELLE_ATTRIBUTE_RX(storage::Storage&, storage);
      ELLE_ATTRIBUTE_R(Configuration, configuration);
      /// Read access to the committed records.
      ELLE_ATTRIBUTE_R(ledger::Ledger, ledger);
      ELLE_ATTRIBUTE_R(registry::Registry, registry);
      /// State the last instruction ended in.
      ELLE_ATTRIBUTE_R(State, state);

    /*-------------.
    | Instructions |
    `-------------*/
    public:
      /// Run Orchestrator::mint, all or nothing.
      void
      mint(Accounts const& accounts,
           std::string const& identifier,
           std::string const& name,
           std::string const& uri);
      /// Mint with the accounts an honest caller would present.
      void
      mint(derivation::Address const& owner,
           std::string const& identifier,
           std::string const& name,
           std::string const& uri);

    /*----------.
    | Printable |
    `----------*/
    public:
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
