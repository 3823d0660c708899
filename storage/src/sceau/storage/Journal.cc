#include <cstring>
#include <stdexcept>

#include <elle/assert.hh>
#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/Exception.hh>
#include <sceau/storage/Collision.hh>
#include <sceau/storage/Journal.hh>
#include <sceau/storage/Missing.hh>

ELLE_LOG_COMPONENT("sceau.storage.Journal");

namespace sceau
{
  namespace storage
  {
    static
    std::unique_ptr<elle::Buffer>
    _copy(elle::Buffer const& data)
    {
      return std::unique_ptr<elle::Buffer>(
        new elle::Buffer(data.contents(), data.size()));
    }

    static
    bool
    _same(elle::Buffer const& a, elle::Buffer const& b)
    {
      return a.size() == b.size() &&
        (a.size() == 0 || std::memcmp(a.contents(), b.contents(), a.size()) == 0);
    }

    /*-------------.
    | Construction |
    `-------------*/

    Journal::Journal(Storage& backend):
      Storage(),
      _backend(backend),
      _committed(false),
      _transcript()
    {}

    Journal::~Journal()
    {
      if (!this->_committed && !this->_transcript.empty())
        ELLE_DEBUG("%s: discard %s pending writes",
                   *this, this->_transcript.size());
    }

    /*-------------.
    | Transactions |
    `-------------*/

    void
    Journal::commit()
    {
      ELLE_TRACE_SCOPE("%s: commit %s writes", *this, this->_transcript.size());
      this->_writable();
      this->_check();
      Undo undo;
      try
      {
        for (auto const& action: this->_transcript)
        {
          Address const& address = action.first;
          Entry const& entry = action.second;
          if (entry.created)
          {
            ELLE_ASSERT(entry.data != nullptr);
            this->_backend.store(address, *entry.data);
            undo.emplace_back(address, nullptr);
          }
          else
          {
            ELLE_ASSERT(entry.base != nullptr);
            if (entry.data == nullptr)
              this->_backend.erase(address);
            else
              this->_backend.update(address, *entry.data);
            undo.emplace_back(address, _copy(*entry.base));
          }
        }
      }
      catch (std::exception const& e)
      {
        ELLE_WARN("%s: commit failed, revert %s writes: %s",
                  *this, undo.size(), e.what());
        this->_revert(undo);
        throw;
      }
      this->_committed = true;
      this->_transcript.clear();
    }

    void
    Journal::_check() const
    {
      for (auto const& action: this->_transcript)
      {
        Address const& address = action.first;
        Entry const& entry = action.second;
        if (entry.created)
        {
          if (this->_backend.exist(address))
          {
            ELLE_WARN("%s: %s was created meanwhile", *this, address);
            throw Collision(address);
          }
        }
        else
        {
          if (!this->_backend.exist(address))
          {
            ELLE_WARN("%s: %s was erased meanwhile", *this, address);
            throw Missing(address);
          }
          if (!_same(this->_backend.load(address), *entry.base))
          {
            ELLE_WARN("%s: %s was modified meanwhile", *this, address);
            throw Exception(
              elle::sprintf("%s was modified by another writer", address));
          }
        }
      }
    }

    void
    Journal::_revert(Undo& undo)
    {
      for (auto it = undo.rbegin(); it != undo.rend(); ++it)
      {
        try
        {
          if (it->second == nullptr)
          {
            if (this->_backend.exist(it->first))
              this->_backend.erase(it->first);
          }
          else if (this->_backend.exist(it->first))
            this->_backend.update(it->first, *it->second);
          else
            this->_backend.store(it->first, *it->second);
        }
        catch (std::exception const& e)
        {
          ELLE_ERR("%s: unable to revert %s: %s", *this, it->first, e.what());
        }
      }
    }

    void
    Journal::discard()
    {
      ELLE_TRACE_SCOPE("%s: discard", *this);
      this->_transcript.clear();
    }

    bool
    Journal::empty() const
    {
      return this->_transcript.empty();
    }

    /*---------------.
    | Implementation |
    `---------------*/

    void
    Journal::_writable() const
    {
      if (this->_committed)
        throw Exception("journal already committed");
    }

    bool
    Journal::_exist(Address const& address) const
    {
      auto it = this->_transcript.find(address);
      if (it != this->_transcript.end())
        return it->second.data != nullptr;
      return this->_backend.exist(address);
    }

    void
    Journal::_create(Address const& address,
                     elle::Buffer const& data)
    {
      this->_writable();
      auto it = this->_transcript.find(address);
      if (it == this->_transcript.end())
      {
        Entry entry{_copy(data), true, nullptr};
        this->_transcript.emplace(address, std::move(entry));
      }
      else
        // Recreated after an erasure: this replaces the backend record.
        it->second.data = _copy(data);
    }

    void
    Journal::_store(Address const& address,
                    elle::Buffer const& data)
    {
      this->_writable();
      auto it = this->_transcript.find(address);
      if (it == this->_transcript.end())
      {
        Entry entry{_copy(data), false, _copy(this->_backend.load(address))};
        this->_transcript.emplace(address, std::move(entry));
      }
      else
        it->second.data = _copy(data);
    }

    elle::Buffer
    Journal::_load(Address const& address) const
    {
      auto it = this->_transcript.find(address);
      if (it != this->_transcript.end())
      {
        ELLE_ASSERT(it->second.data != nullptr);
        return elle::Buffer(it->second.data->contents(),
                            it->second.data->size());
      }
      return this->_backend.load(address);
    }

    void
    Journal::_erase(Address const& address)
    {
      this->_writable();
      auto it = this->_transcript.find(address);
      if (it == this->_transcript.end())
      {
        Entry entry{nullptr, false, _copy(this->_backend.load(address))};
        this->_transcript.emplace(address, std::move(entry));
      }
      else if (it->second.created)
        // Never reached the backend.
        this->_transcript.erase(it);
      else
        it->second.data.reset();
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Journal::print(std::ostream& stream) const
    {
      stream << "storage::Journal(" << this->_backend << ")";
    }
  }
}
