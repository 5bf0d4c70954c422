#include "TokenAcquirer.hpp"
#include "TokenTransform.hpp"

#include <plog/Log.h>

namespace translate
{

TokenAcquirer::TokenAcquirer(std::shared_ptr<KeyPairStore> store)
    : store_(std::move(store))
{
}

std::string TokenAcquirer::derive(const std::string& text, const std::atomic<bool>* running)
{
    const KeyPair pair = store_->current(running);
    std::string tk = token::deriveToken(text, pair);
    PLOG_DEBUG << "Derived token " << tk << " for " << text.size() << " byte text";
    return tk;
}

} // namespace translate
