#include "stats.hpp"
#include <iomanip>
#include <sstream>

namespace dotvid {

double PipelineStats::throughput_fps() const {
    if (total_ms <= 0.0) return 0.0;
    return frames * 1000.0 / total_ms;
}

double PipelineStats::throughput_mbps() const {
    if (total_ms <= 0.0) return 0.0;
    return (original_length / 1024.0 / 1024.0) * 1000.0 / total_ms;
}

std::string PipelineStats::to_json() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "{\n";
    oss << "  \"mode\": \"" << (decoding ? "decode" : "encode") << "\",\n";
    oss << "  \"threads\": " << threads << ",\n";
    oss << "  \"frames\": " << frames << ",\n";
    oss << "  \"original_length\": " << original_length << ",\n";
    oss << "  \"input_bytes\": " << input_bytes << ",\n";
    oss << "  \"output_bytes\": " << output_bytes << ",\n";
    oss << "  \"frames_discarded\": " << frames_discarded << ",\n";
    oss << "  \"peak_reorder_depth\": " << peak_reorder_depth << ",\n";
    oss << "  \"setup_ms\": " << setup_ms << ",\n";
    oss << "  \"transform_ms\": " << transform_ms << ",\n";
    oss << "  \"total_ms\": " << total_ms << ",\n";
    oss << "  \"throughput_fps\": " << throughput_fps() << ",\n";
    oss << "  \"throughput_mbps\": " << throughput_mbps() << "\n";
    oss << "}";

    return oss.str();
}

} // namespace dotvid
