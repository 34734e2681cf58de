// extractor_registration.hpp
#pragma once
#include "extractor_registry.hpp"

// Binds CLASSNAME as the reader for containers of the given ContainerFormat.
#define REGISTER_EXTRACTOR(CLASSNAME, FORMAT) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                ExtractorRegistry::instance().registerExtractor(FORMAT, []() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
