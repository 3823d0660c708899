#include <elle/log.hh>
#include <elle/printf.hh>

#include <cryptography/Digest.hh>
#include <cryptography/Plain.hh>
#include <cryptography/oneway.hh>

#include <sceau/derivation/InvalidSeeds.hh>
#include <sceau/derivation/curve.hh>
#include <sceau/derivation/derive.hh>

ELLE_LOG_COMPONENT("sceau.derivation");

namespace sceau
{
  namespace derivation
  {
    std::string const marker("ProgramDerivedAddress");

    std::string
    seed(Address const& address)
    {
      return std::string(address.value().begin(), address.value().end());
    }

    static
    Address
    _hash(Seeds const& seeds,
          Address const& program)
    {
      if (seeds.size() > max_seeds)
        throw InvalidSeeds(elle::sprintf("%s seeds, at most %s allowed",
                                         seeds.size(), max_seeds));
      elle::Buffer input;
      for (auto const& seed: seeds)
      {
        if (seed.size() > max_seed_length)
          throw InvalidSeeds(
            elle::sprintf("seed of %s bytes, at most %s allowed",
                          seed.size(), max_seed_length));
        input.append(seed.data(), seed.size());
      }
      input.append(program.value().data(), program.value().size());
      input.append(marker.data(), marker.size());

      using namespace infinit::cryptography;
      Digest digest{
        oneway::hash(Plain{elle::WeakBuffer{input.mutable_contents(),
                                            input.size()}},
                     oneway::Algorithm::sha256)};
      return Address(digest.buffer());
    }

    Address
    create(Seeds const& seeds,
           Address const& program)
    {
      Address res = _hash(seeds, program);
      if (curve::on_curve(res))
        throw InvalidSeeds(elle::sprintf("%s lies on the curve", res));
      return res;
    }

    std::pair<Address, Nonce>
    find(Seeds const& seeds,
         Address const& program)
    {
      ELLE_TRACE_SCOPE("find address for %s seeds under %s",
                       seeds.size(), program);
      Seeds candidate(seeds);
      candidate.push_back(std::string());
      for (unsigned int nonce = 0; nonce <= 255; ++nonce)
      {
        Nonce byte = static_cast<Nonce>(nonce);
        candidate.back() = std::string(1, static_cast<char>(byte));
        Address address = _hash(candidate, program);
        if (!curve::on_curve(address))
        {
          ELLE_DEBUG("found %s with nonce %s", address, nonce);
          return std::make_pair(address, byte);
        }
        ELLE_DUMP("nonce %s lies on the curve", nonce);
      }
      throw InvalidSeeds("no nonce yields an address off the curve");
    }

    Proof
    prove(Seeds seeds,
          Address const& program)
    {
      auto found = find(seeds, program);
      return Proof(std::move(seeds), found.second, program, found.first);
    }
  }
}
