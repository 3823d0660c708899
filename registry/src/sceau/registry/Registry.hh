#ifndef SCEAU_REGISTRY_REGISTRY_HH
# define SCEAU_REGISTRY_REGISTRY_HH

# include <string>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/derivation/Proof.hh>
# include <sceau/ledger/Ledger.hh>
# include <sceau/registry/Metadata.hh>
# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace registry
  {
    /// The metadata registry service.
    ///
    /// Attaches one metadata record to a mint, at an address derived from
    /// the mint under the registry program.  The mint authority must
    /// prove itself through the derivation proof it was created with.
    class Registry:
      public elle::Printable
    {
    /*------.
    | Types |
    `------*/
    public:
      typedef derivation::Address Address;

    /*----------.
    | Constants |
    `----------*/
    public:
      static std::string const metadata_tag;
      static std::size_t const max_name_length = 32;
      static std::size_t const max_symbol_length = 10;
      static std::size_t const max_uri_length = 200;
      static int const max_seller_fee_basis_points = 10000;
      static std::size_t const max_creators = 5;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      Registry(storage::Storage& storage,
               ledger::Ledger const& ledger,
               Address program);
      ELLE_ATTRIBUTE_RX(storage::Storage&, storage);
      ELLE_ATTRIBUTE_R(ledger::Ledger const&, ledger);
      ELLE_ATTRIBUTE_R(Address, program);

    /*-----------.
    | Operations |
    `-----------*/
    public:
      /// Where the metadata of a mint lives under a registry program.
      static
      Address
      metadata_address(Address const& program,
                       Address const& mint);
      /// Attach metadata to a mint.
      ///
      /// @param metadata The address to create the record at, which must be
      ///                 the metadata address of the mint.
      /// @param mint_authority The proof of the mint authority.
      /// @param update_authority_is_signer Whether the update authority
      ///                                   acts through the same proof.
      ///
      /// Throw AuthorizationError if the address or the proof is rejected,
      /// IssuanceError if the data is invalid or the record exists.
      void
      create_metadata(Address const& metadata,
                      Address const& mint,
                      derivation::Proof const& mint_authority,
                      Address const& update_authority,
                      Data data,
                      bool is_mutable,
                      bool update_authority_is_signer);

    /*--------.
    | Queries |
    `--------*/
    public:
      /// Throw IssuanceError if there is no metadata at the address.
      Metadata
      metadata(Address const& address) const;

    /*----------.
    | Printable |
    `----------*/
    public:
      void
      print(std::ostream& stream) const override;

    private:
      void
      _validate(Data const& data) const;
    };
  }
}

#endif
