// userver
#include <userver/components/minimal_component_list.hpp>
#include <userver/utils/daemon_run.hpp>

// self
#include "detection_engine/detection_engine_component.hpp"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list =
        userver::components::MinimalComponentList()
            .Append<gl_anomaly::DetectionEngineComponent>()
        ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}
