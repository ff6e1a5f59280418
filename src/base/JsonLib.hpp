#ifndef __TT_JSON_LIB__
#define __TT_JSON_LIB__

#include "nlohmann/json.hpp"

namespace tt {
/** @brief Config documents, state snapshots and layout dumps all use this. */
using json = nlohmann::json;
}  // namespace tt

#endif  // __TT_JSON_LIB__
