#include <sceau/storage/Memory.hh>

namespace sceau
{
  namespace storage
  {
    Memory::Memory():
      _records()
    {}

    Memory::~Memory()
    {}

    std::size_t
    Memory::size() const
    {
      return this->_records.size();
    }

    bool
    Memory::_exist(Address const& address) const
    {
      return this->_records.find(address) != this->_records.end();
    }

    void
    Memory::_store(Address const& address,
                   elle::Buffer const& data)
    {
      this->_records.erase(address);
      this->_records.emplace(address,
                             elle::Buffer(data.contents(), data.size()));
    }

    elle::Buffer
    Memory::_load(Address const& address) const
    {
      auto const& data = this->_records.at(address);
      return elle::Buffer(data.contents(), data.size());
    }

    void
    Memory::_erase(Address const& address)
    {
      this->_records.erase(address);
    }

    void
    Memory::print(std::ostream& stream) const
    {
      stream << "storage::Memory(" << this->_records.size() << " records)";
    }
  }
}
