#include <elle/log.hh>

#include <sceau/storage/Collision.hh>
#include <sceau/storage/Missing.hh>
#include <sceau/storage/Storage.hh>

ELLE_LOG_COMPONENT("sceau.storage.Storage");

namespace sceau
{
  namespace storage
  {
    /*-------------.
    | Construction |
    `-------------*/

    Storage::Storage()
    {}

    Storage::~Storage()
    {}

    /*--------.
    | Storage |
    `--------*/

    bool
    Storage::exist(Address const& address) const
    {
      return this->_exist(address);
    }

    void
    Storage::store(Address const& address,
                   elle::Buffer const& data)
    {
      ELLE_TRACE_SCOPE("%s: store %s (%s bytes)", *this, address, data.size());
      if (this->_exist(address))
        throw Collision(address);
      this->_create(address, data);
    }

    void
    Storage::update(Address const& address,
                    elle::Buffer const& data)
    {
      ELLE_TRACE_SCOPE("%s: update %s (%s bytes)", *this, address, data.size());
      if (!this->_exist(address))
        throw Missing(address);
      this->_store(address, data);
    }

    elle::Buffer
    Storage::load(Address const& address) const
    {
      ELLE_TRACE_SCOPE("%s: load %s", *this, address);
      if (!this->_exist(address))
        throw Missing(address);
      return this->_load(address);
    }

    void
    Storage::erase(Address const& address)
    {
      ELLE_TRACE_SCOPE("%s: erase %s", *this, address);
      if (!this->_exist(address))
        throw Missing(address);
      this->_erase(address);
    }

    /*---------------.
    | Implementation |
    `---------------*/

    void
    Storage::_create(Address const& address,
                     elle::Buffer const& data)
    {
      this->_store(address, data);
    }
  }
}
