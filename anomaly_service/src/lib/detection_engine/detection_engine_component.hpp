#pragma once

#include <memory>
#include <string_view>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include "detection_config/detection_config.hpp"
#include "detection_engine/detection_engine.hpp"
#include "detection_engine/gl_data_source.hpp"

namespace gl_anomaly {

// Owns the static detection configuration and hands out engines bound to a
// data source supplied by the caller.
class DetectionEngineComponent final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "gl-anomaly-detection";

    DetectionEngineComponent(const userver::components::ComponentConfig& config,
                             const userver::components::ComponentContext& context);

    static userver::yaml_config::Schema GetStaticConfigSchema();

    const DetectionConfig& GetConfig() const { return config_; }

    std::unique_ptr<DetectionEngine> CreateEngine(const GLDataSource& data_source) const;

private:
    DetectionConfig config_;
};

}  // namespace gl_anomaly
