#ifndef SCEAU_STORAGE_JOURNAL_HH
# define SCEAU_STORAGE_JOURNAL_HH

# include <map>
# include <memory>
# include <utility>
# include <vector>

# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace storage
  {
    /// Record writes on top of another storage without touching it.
    ///
    /// Reads see the recorded writes first, then the backend.  Nothing
    /// reaches the backend until commit(); destroying an uncommitted
    /// journal discards its writes.
    ///
    /// Commits are all or nothing.  Records the journal created must still
    /// be free in the backend and records it replaced or erased must be
    /// unchanged, otherwise nothing is written.  A backend failure while
    /// writing reverts the writes already applied.
    class Journal:
      public Storage
    {
    /*-------------.
    | Construction |
    `-------------*/
    public:
      Journal(Storage& backend);
      ~Journal();
      ELLE_ATTRIBUTE_RX(Storage&, backend);

    /*-------------.
    | Transactions |
    `-------------*/
    public:
      /// Apply every recorded write to the backend, once.
      ///
      /// Throw Collision if a created record was created in the backend
      /// meanwhile, Missing or Exception if a replaced record was erased or
      /// modified meanwhile.
      void
      commit();
      /// Forget every recorded write.
      void
      discard();
      /// Whether writes are pending.
      bool
      empty() const;
    private:
      ELLE_ATTRIBUTE_R(bool, committed);

    /*---------------.
    | Implementation |
    `---------------*/
    protected:
      bool
      _exist(Address const& address) const override;
      void
      _store(Address const& address,
             elle::Buffer const& data) override;
      void
      _create(Address const& address,
              elle::Buffer const& data) override;
      elle::Buffer
      _load(Address const& address) const override;
      void
      _erase(Address const& address) override;

    /*----------.
    | Printable |
    `----------*/
    public:
      void
      print(std::ostream& stream) const override;

    private:
      struct Entry
      {
        /// Null for an erasure.
        std::unique_ptr<elle::Buffer> data;
        /// Whether the address was free in the backend.
        bool created;
        /// The backend record this entry replaces, null if created.
        std::unique_ptr<elle::Buffer> base;
      };
      typedef std::map<Address, Entry> Transcript;
      ELLE_ATTRIBUTE(Transcript, transcript);
      /// Backend records to restore, null ones to erase.
      typedef std::vector<std::pair<Address, std::unique_ptr<elle::Buffer>>>
        Undo;
      void
      _check() const;
      void
      _revert(Undo& undo);
      void
      _writable() const;
    };
  }
}

#endif
