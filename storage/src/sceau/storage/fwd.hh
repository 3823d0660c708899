#ifndef SCEAU_STORAGE_FWD_HH
# define SCEAU_STORAGE_FWD_HH

namespace sceau
{
  namespace storage
  {
    class Storage;
    class Memory;
    class Directory;
    class Journal;
  }
}

#endif
