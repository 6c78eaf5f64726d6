#pragma once
#include <memory>

namespace pintrust::utils
{

template <typename T, void (*f)(T*)> struct StaticFunctionDeleter
{
    void operator()(T* t) const
    {
        f(t);
    }
};

} // namespace pintrust::utils

#define PINTRUST_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)        \
    struct alias : public std::unique_ptr<object, deleter>                     \
    {                                                                          \
        using unique_ptr::unique_ptr;                                          \
                                                                               \
        operator object*() const                                               \
        {                                                                      \
            return this->get();                                                \
        }                                                                      \
    }

#define PINTRUST_DEFINE_UNIQUE_PTR(alias, object, deleter)                     \
    using alias##Deleter = pintrust::utils::StaticFunctionDeleter<object, &deleter>; \
    PINTRUST_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
