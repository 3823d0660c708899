#ifndef SCEAU_STORAGE_DIRECTORY_HH
# define SCEAU_STORAGE_DIRECTORY_HH

# include <boost/filesystem/path.hpp>

# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace storage
  {
    /// One file per record, named after the base58 address, under a root
    /// directory.
    class Directory:
      public Storage
    {
    /*-------------.
    | Construction |
    `-------------*/
    public:
      Directory(boost::filesystem::path const& root);
      ~Directory();
      ELLE_ATTRIBUTE_R(boost::filesystem::path, root);

    /*---------------.
    | Implementation |
    `---------------*/
    protected:
      bool
      _exist(Address const& address) const override;
      void
      _store(Address const& address,
             elle::Buffer const& data) override;
      /// Link a fully written temporary file to the record path, which
      /// fails if another process created the record first.
      void
      _create(Address const& address,
              elle::Buffer const& data) override;
      elle::Buffer
      _load(Address const& address) const override;
      void
      _erase(Address const& address) override;

    /*----------.
    | Utilities |
    `----------*/
    public:
      /// The file holding the record at the address.
      boost::filesystem::path
      path(Address const& address) const;

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
