#pragma once

#include <flow/log/log.hpp>
#include <flow/util/util.hpp>

#include <boost/unordered_map.hpp>

#include <string>

namespace apipe {

/**
 * @brief The flow::log component payload enumeration for apipe's own log call sites.
 *
 * Users who pass a flow::log::Logger through apipe::pipe_options register these with
 * `flow::log::Config::init_component_to_union_idx_mapping<apipe::Log_component>()` and
 * `init_component_names<apipe::Log_component>(apipe::S_APIPE_LOG_COMPONENT_NAME_MAP, ...)`.
 * Members are generated from detail/log_component_enum_declare.macros.hpp.
 */
#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_APIPE_LOG_COMPONENT_NAME_MAP
#include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#include "./detail/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_hdr.macros.hpp>
#undef FLOW_LOG_CFG_COMPONENT_ENUM_CLASS
#undef FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP

}  // namespace apipe
