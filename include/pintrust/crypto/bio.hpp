#pragma once
#include <cstdint>
#include <limits>
#include <string>

#include <openssl/bio.h>

#include <pintrust/crypto/pointers.hpp>
#include <pintrust/crypto/exception.hpp>

namespace pintrust::crypto
{

class BioTraits
{
public:
    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        constexpr size_t limit = static_cast<size_t>(std::numeric_limits<int>::max());
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size > limit ? limit : size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(length < 0, "invalid memory BIO");
        if (length == 0)
        {
            return std::string();
        }
        return std::string(data, static_cast<size_t>(length));
    }
};

} // namespace pintrust::crypto
