#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/AuthorizationError.hh>
#include <sceau/IssuanceError.hh>
#include <sceau/derivation/derive.hh>
#include <sceau/registry/Registry.hh>
#include <sceau/storage/json.hh>

ELLE_LOG_COMPONENT("sceau.registry.Registry");

namespace sceau
{
  namespace registry
  {
    /*----------.
    | Constants |
    `----------*/

    std::string const Registry::metadata_tag("metadata");
    std::size_t const Registry::max_name_length;
    std::size_t const Registry::max_symbol_length;
    std::size_t const Registry::max_uri_length;
    int const Registry::max_seller_fee_basis_points;
    std::size_t const Registry::max_creators;

    /*-------------.
    | Construction |
    `-------------*/

    Registry::Registry(storage::Storage& storage,
                       ledger::Ledger const& ledger,
                       Address program):
      _storage(storage),
      _ledger(ledger),
      _program(std::move(program))
    {}

    /*-----------.
    | Operations |
    `-----------*/

    Registry::Address
    Registry::metadata_address(Address const& program,
                               Address const& mint)
    {
      derivation::Seeds seeds{
        metadata_tag, derivation::seed(program), derivation::seed(mint)};
      return derivation::find(seeds, program).first;
    }

    void
    Registry::create_metadata(Address const& metadata,
                              Address const& mint,
                              derivation::Proof const& mint_authority,
                              Address const& update_authority,
                              Data data,
                              bool is_mutable,
                              bool update_authority_is_signer)
    {
      ELLE_TRACE_SCOPE("%s: create metadata %s for %s", *this, metadata, mint);
      Address expected = metadata_address(this->_program, mint);
      if (metadata != expected)
        throw AuthorizationError(
          elle::sprintf("%s is not the metadata address of %s, %s is",
                        metadata, mint, expected));
      auto record = this->_ledger.mint(mint);
      if (!mint_authority.authorizes(record.authority))
      {
        ELLE_WARN("%s: %s cannot act as the authority %s of %s",
                  *this, mint_authority, record.authority, mint);
        throw AuthorizationError(
          elle::sprintf("%s is not the authority of %s",
                        mint_authority.address(), mint));
      }
      if (update_authority_is_signer &&
          !mint_authority.authorizes(update_authority))
        throw AuthorizationError(
          elle::sprintf("update authority %s did not sign", update_authority));
      this->_validate(data);
      if (this->_storage.exist(metadata))
        throw IssuanceError(
          elle::sprintf("metadata %s already exists", metadata));
      Metadata created(mint,
                       record.authority,
                       update_authority,
                       std::move(data),
                       is_mutable);
      ELLE_DEBUG("store %s", created);
      this->_storage.store(metadata, storage::json::encode(created));
    }

    void
    Registry::_validate(Data const& data) const
    {
      if (data.name.size() > max_name_length)
        throw IssuanceError(
          elle::sprintf("name is longer than %s bytes", max_name_length));
      if (data.symbol.size() > max_symbol_length)
        throw IssuanceError(
          elle::sprintf("symbol is longer than %s bytes", max_symbol_length));
      if (data.uri.size() > max_uri_length)
        throw IssuanceError(
          elle::sprintf("uri is longer than %s bytes", max_uri_length));
      if (data.seller_fee_basis_points < 0 ||
          data.seller_fee_basis_points > max_seller_fee_basis_points)
        throw IssuanceError(
          elle::sprintf("invalid seller fee: %s basis points",
                        data.seller_fee_basis_points));
      if (data.creators.size() > max_creators)
        throw IssuanceError(
          elle::sprintf("more than %s creators", max_creators));
      if (!data.creators.empty())
      {
        int shares = 0;
        for (auto const& creator: data.creators)
        {
          if (creator.share < 0 || creator.share > 100)
            throw IssuanceError(
              elle::sprintf("invalid creator share: %s", creator.share));
          shares += creator.share;
        }
        if (shares != 100)
          throw IssuanceError(
            elle::sprintf("creator shares add up to %s, not 100", shares));
      }
    }

    /*--------.
    | Queries |
    `--------*/

    Metadata
    Registry::metadata(Address const& address) const
    {
      if (!this->_storage.exist(address))
        throw IssuanceError(elle::sprintf("no metadata at %s", address));
      return storage::json::decode<Metadata>(this->_storage.load(address));
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Registry::print(std::ostream& stream) const
    {
      stream << "Registry(" << this->_program << ")";
    }
  }
}
