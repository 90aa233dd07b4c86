#include "arbiter/rule/structure/result.hpp"

namespace arbiter::rule {

    std::string_view toString(RuleType type) {
        switch (type) {
        case RuleType::Chain:
            return "ChainRule";
        case RuleType::BestFirst:
            return "BestFirstRule";
        }
        return "UnknownRuleType";
    }

    std::ostream &operator<<(std::ostream &os, RuleType type) { return os << toString(type); }

} // namespace arbiter::rule
