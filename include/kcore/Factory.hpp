/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_FACTORY_HPP
#define KCORE_FACTORY_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Exception.hpp>
#include <dlfcn.h>
#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kcore {

template <typename Base, typename... Args>
class Factory;

template <typename FactoryType, typename Derived>
struct Registrar;

/**
 * @brief Registry of named implementations of Base. A key of the form
 * "name:path/to/library.so" loads the library before the lookup so that
 * the library can register "name" from its static initializers.
 */
template <typename Base, typename... Args>
class Factory {

    public:

    static std::unique_ptr<Base> create(const std::string& key, Args&&... args) {
        auto& factory = instance();
        std::string name = key;
        std::size_t found = key.find(":");
        if (found != std::string::npos) {
            name = key.substr(0, found);
            const auto path = key.substr(found + 1);
            auto it = factory.m_creator_fn.find(name);
            if (it == factory.m_creator_fn.end()) {
                if(dlopen(path.c_str(), RTLD_NOW) == nullptr) {
                    const char* err = dlerror();
                    throw Exception{"Could not load library " + path + ": "
                                    + (err ? err : "unknown error")};
                }
            }
        }
        auto it = factory.m_creator_fn.find(name);
        if (it != factory.m_creator_fn.end()) {
            return it->second(std::forward<Args>(args)...);
        } else {
            throw Exception("Creator not found for \"" + name + "\"");
        }
    }

    static bool contains(const std::string& name) {
        auto& factory = instance();
        return factory.m_creator_fn.count(name) != 0;
    }

private:

    template <typename FactoryType, typename Derived>
    friend struct Registrar;

    using CreatorFunction = std::function<std::unique_ptr<Base>(Args...)>;

    static Factory& instance() {
        static Factory factory;
        return factory;
    }

    void registerCreator(const std::string& key, CreatorFunction creator) {
        m_creator_fn[key] = std::move(creator);
    }

    std::unordered_map<std::string, CreatorFunction> m_creator_fn;
};

template <typename FactoryType, typename Derived>
struct Registrar {

    explicit Registrar(const std::string& key) {
        FactoryType::instance().registerCreator(key, &Derived::create);
    }

};

}

#define KCORE_REGISTER_IMPLEMENTATION_FOR(__factory__, __derived__, __name__) \
    static ::kcore::Registrar<__factory__, __derived__> \
    __kcoreRegistrarFor ## __factory__ ## _ ## __derived__ ## _ ## __name__{#__name__}

#endif
