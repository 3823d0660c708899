#include <algorithm>
#include <vector>

#include <elle/assert.hh>
#include <elle/printf.hh>

#include <sceau/derivation/InvalidAddress.hh>
#include <sceau/derivation/base58.hh>

namespace sceau
{
  namespace derivation
  {
    namespace base58
    {
      static char const alphabet[] =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

      static
      int
      _digit(char c)
      {
        char const* end = alphabet + sizeof(alphabet) - 1;
        char const* found = std::find(alphabet, end, c);
        if (found == end)
          return -1;
        return static_cast<int>(found - alphabet);
      }

      std::string
      encode(unsigned char const* data,
             std::size_t size)
      {
        std::size_t zeros = 0;
        while (zeros < size && data[zeros] == 0)
          ++zeros;
        // log(256) / log(58), rounded up.
        std::vector<unsigned char> digits((size - zeros) * 138 / 100 + 1, 0);
        std::size_t length = 0;
        for (std::size_t i = zeros; i < size; ++i)
        {
          unsigned int carry = data[i];
          std::size_t j = 0;
          for (auto it = digits.rbegin();
               (carry != 0 || j < length) && it != digits.rend();
               ++it, ++j)
          {
            carry += 256 * *it;
            *it = carry % 58;
            carry /= 58;
          }
          ELLE_ASSERT_EQ(carry, 0u);
          length = j;
        }
        auto it = digits.begin() + (digits.size() - length);
        while (it != digits.end() && *it == 0)
          ++it;
        std::string res(zeros, '1');
        for (; it != digits.end(); ++it)
          res += alphabet[*it];
        return res;
      }

      elle::Buffer
      decode(std::string const& representation)
      {
        std::size_t zeros = 0;
        while (zeros < representation.size() && representation[zeros] == '1')
          ++zeros;
        // log(58) / log(256), rounded up.
        std::vector<unsigned char> bytes(
          (representation.size() - zeros) * 733 / 1000 + 1, 0);
        std::size_t length = 0;
        for (std::size_t i = zeros; i < representation.size(); ++i)
        {
          int digit = _digit(representation[i]);
          if (digit < 0)
            throw InvalidAddress(
              representation,
              elle::sprintf("unexpected character '%s'", representation[i]));
          unsigned int carry = digit;
          std::size_t j = 0;
          for (auto it = bytes.rbegin();
               (carry != 0 || j < length) && it != bytes.rend();
               ++it, ++j)
          {
            carry += 58 * *it;
            *it = carry % 256;
            carry /= 256;
          }
          ELLE_ASSERT_EQ(carry, 0u);
          length = j;
        }
        auto it = bytes.begin() + (bytes.size() - length);
        while (it != bytes.end() && *it == 0)
          ++it;
        elle::Buffer res;
        std::vector<unsigned char> leading(zeros, 0);
        if (!leading.empty())
          res.append(leading.data(), leading.size());
        if (it != bytes.end())
          res.append(&*it, bytes.end() - it);
        return res;
      }
    }
  }
}
