#include "./log.hpp"

namespace apipe {

#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_APIPE_LOG_COMPONENT_NAME_MAP
#include <flow/log/macros/config_enum_start_cpp.macros.hpp>
#include "./detail/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_cpp.macros.hpp>
#undef FLOW_LOG_CFG_COMPONENT_ENUM_CLASS
#undef FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP

}  // namespace apipe
