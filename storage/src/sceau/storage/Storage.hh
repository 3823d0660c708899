#ifndef SCEAU_STORAGE_STORAGE_HH
# define SCEAU_STORAGE_STORAGE_HH

# include <elle/Buffer.hh>
# include <elle/Printable.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/storage/fwd.hh>

namespace sceau
{
  namespace storage
  {
    /// Serialized records indexed by address.
    ///
    /// Creation is exclusive: storing at an address which already holds
    /// a record fails, which is what serializes concurrent attempts to
    /// issue the same resource.
    class Storage:
      public elle::Printable
    {
    /*------.
    | Types |
    `------*/
    public:
      typedef derivation::Address Address;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      Storage();
      virtual
      ~Storage();

    /*--------.
    | Storage |
    `--------*/
    public:
      /// Whether a record exists at the address.
      bool
      exist(Address const& address) const;
      /// Create the record, throw Collision if the address is taken.
      void
      store(Address const& address,
            elle::Buffer const& data);
      /// Replace the record, throw Missing if there is none.
      void
      update(Address const& address,
             elle::Buffer const& data);
      /// Retrieve the record, throw Missing if there is none.
      elle::Buffer
      load(Address const& address) const;
      /// Remove the record, throw Missing if there is none.
      void
      erase(Address const& address);

    /*---------------.
    | Implementation |
    `---------------*/
    protected:
      virtual
      bool
      _exist(Address const& address) const = 0;
      /// Write the record, existing or not.
      virtual
      void
      _store(Address const& address,
             elle::Buffer const& data) = 0;
      /// Write a new record.
      ///
      /// Backends shared between processes must throw Collision if the
      /// address got taken since _exist() was checked.  Defaults to
      /// _store().
      virtual
      void
      _create(Address const& address,
              elle::Buffer const& data);
      virtual
      elle::Buffer
      _load(Address const& address) const = 0;
      virtual
      void
      _erase(Address const& address) = 0;
    };
  }
}

#endif
