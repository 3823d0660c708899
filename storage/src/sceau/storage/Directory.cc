#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

#include <boost/filesystem.hpp>

#include <elle/AtomicFile.hh>
#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/Exception.hh>
#include <sceau/storage/Collision.hh>
#include <sceau/storage/Directory.hh>

ELLE_LOG_COMPONENT("sceau.storage.Directory");

namespace sceau
{
  namespace storage
  {
    /*-------------.
    | Construction |
    `-------------*/

    Directory::Directory(boost::filesystem::path const& root):
      Storage(),
      _root(root)
    {
      boost::filesystem::create_directories(this->_root);
    }

    Directory::~Directory()
    {}

    /*---------------.
    | Implementation |
    `---------------*/

    bool
    Directory::_exist(Address const& address) const
    {
      return boost::filesystem::is_regular_file(this->path(address));
    }

    void
    Directory::_store(Address const& address,
                      elle::Buffer const& data)
    {
      ELLE_DEBUG("%s: write %s", *this, this->path(address));
      elle::AtomicFile file(this->path(address));
      file.write() << [&] (elle::AtomicFile::Write& write)
      {
        write.stream().write(reinterpret_cast<char const*>(data.contents()),
                             data.size());
      };
    }

    void
    Directory::_create(Address const& address,
                       elle::Buffer const& data)
    {
      auto target = this->path(address);
      auto temporary =
        this->_root / boost::filesystem::unique_path(".%%%%-%%%%-%%%%.tmp");
      ELLE_DEBUG("%s: create %s through %s", *this, target, temporary);
      {
        std::ofstream output(temporary.string(),
                             std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<char const*>(data.contents()),
                     data.size());
        output.close();
        if (!output)
        {
          boost::filesystem::remove(temporary);
          throw Exception(
            elle::sprintf("unable to write %s", temporary.string()));
        }
      }
      int res = ::link(temporary.string().c_str(), target.string().c_str());
      int error = errno;
      boost::filesystem::remove(temporary);
      if (res != 0)
      {
        if (error == EEXIST)
        {
          ELLE_WARN("%s: %s was created by another writer", *this, address);
          throw Collision(address);
        }
        throw Exception(elle::sprintf("unable to create %s: %s",
                                      target.string(), ::strerror(error)));
      }
    }

    elle::Buffer
    Directory::_load(Address const& address) const
    {
      std::string content;
      elle::AtomicFile file(this->path(address));
      file.read() << [&] (elle::AtomicFile::Read& read)
      {
        content.assign(std::istreambuf_iterator<char>(read.stream()),
                       std::istreambuf_iterator<char>());
      };
      return elle::Buffer(content.data(), content.size());
    }

    void
    Directory::_erase(Address const& address)
    {
      boost::filesystem::remove(this->path(address));
    }

    /*----------.
    | Utilities |
    `----------*/

    boost::filesystem::path
    Directory::path(Address const& address) const
    {
      return this->_root / (address.string() + ".json");
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Directory::print(std::ostream& stream) const
    {
      stream << "storage::Directory(" << this->_root.string() << ")";
    }
  }
}
