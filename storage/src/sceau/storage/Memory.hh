#ifndef SCEAU_STORAGE_MEMORY_HH
# define SCEAU_STORAGE_MEMORY_HH

# include <map>

# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace storage
  {
    /// Storage held in memory for the lifetime of the object.
    class Memory:
      public Storage
    {
    public:
      Memory();
      ~Memory();

    public:
      /// Number of records.
      std::size_t
      size() const;

    protected:
      bool
      _exist(Address const& address) const override;
      void
      _store(Address const& address,
             elle::Buffer const& data) override;
      elle::Buffer
      _load(Address const& address) const override;
      void
      _erase(Address const& address) override;

    public:
      void
      print(std::ostream& stream) const override;

    private:
      typedef std::map<Address, elle::Buffer> Records;
      ELLE_ATTRIBUTE(Records, records);
    };
  }
}

#endif
