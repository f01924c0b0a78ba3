#include "delay/delay_classification.h"

namespace middle_server {
namespace delay {

std::string_view toString(DelayClassification classification) {
    switch (classification) {
    case DelayClassification::Initialized:
        return "initialized";
    case DelayClassification::Enabled:
        return "enabled";
    case DelayClassification::Disabled:
        return "disabled";
    }
    return "initialized";
}

}  // namespace delay
}  // namespace middle_server
