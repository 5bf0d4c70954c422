#pragma once

#include "KeyPairStore.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace translate
{

// Produces the tk parameter for a request: current key pair + token transform
class TokenAcquirer
{
public:
    explicit TokenAcquirer(std::shared_ptr<KeyPairStore> store);

    // Never fails; a page that cannot be read yields a token from the fallback pair,
    // which the endpoint will most likely reject.
    std::string derive(const std::string& text, const std::atomic<bool>* running = nullptr);

    KeyPairStore& store() { return *store_; }

private:
    std::shared_ptr<KeyPairStore> store_;
};

} // namespace translate
