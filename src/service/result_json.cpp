#include "service/result_json.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace bench_analysis::service {
namespace {

constexpr int kDoublePrecision = 15;

std::string escape_json(const std::string& str) {
    std::ostringstream out;
    for (const char ch : str) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(ch))
                        << std::dec << std::setfill(' ');
                } else {
                    out << ch;
                }
        }
    }
    return out.str();
}

void append_int_array(const std::vector<int>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
}

void append_double_array(const std::vector<double>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
}

void append_string_array(const std::vector<std::string>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << '"' << escape_json(values[i]) << '"';
    }
    out << ']';
}

void append_quantum_volume(const QuantumVolumeResult& result, std::ostringstream& out) {
    out << "{\"quantum_volume\":" << result.quantum_volume
        << ",\"success\":" << (result.success ? "true" : "false")
        << ",\"confidence\":" << result.confidence
        << ",\"heavy_output_probability\":";
    append_double_array(result.heavy_output_probability, out);
    out << ",\"mean_hop\":" << result.mean_hop
        << ",\"sigma\":" << result.sigma
        << ",\"depth\":" << result.depth
        << ",\"trials\":" << result.trials << '}';
}

void append_composite(const CompositeAggregateResult& result, std::ostringstream& out) {
    out << "{\"experiment_types\":";
    append_string_array(result.experiment_types, out);
    out << ",\"experiment_ids\":";
    append_string_array(result.experiment_ids, out);
    out << ",\"experiment_qubits\":[";
    for (std::size_t i = 0; i < result.experiment_qubits.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_int_array(result.experiment_qubits[i], out);
    }
    out << "]}";
}

void append_result(const AnalysisResultData& result, std::ostringstream& out) {
    out << "{\"name\":\"" << escape_json(result.name) << "\",\"value\":";
    std::visit(
        [&out](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, QuantumVolumeResult>) {
                append_quantum_volume(value, out);
            } else {
                append_composite(value, out);
            }
        },
        result.value);
    out << '}';
}

void append_diagnostic(const Diagnostic& diagnostic, std::ostringstream& out) {
    out << "{\"experiment_id\":\"" << escape_json(diagnostic.experiment_id)
        << "\",\"category\":\"" << escape_json(diagnostic.category)
        << "\",\"message\":\"" << escape_json(diagnostic.message) << "\"}";
}

void append_experiment_data(const ExperimentData& data, std::ostringstream& out) {
    out << "{\"experiment_id\":\"" << escape_json(data.experiment_id())
        << "\",\"experiment_type\":\"" << escape_json(data.experiment_type())
        << "\",\"physical_qubits\":";
    append_int_array(data.physical_qubits(), out);
    out << ",\"analysis_results\":[";
    for (std::size_t i = 0; i < data.analysis_results().size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_result(data.analysis_results()[i], out);
    }
    out << "],\"diagnostics\":[";
    for (std::size_t i = 0; i < data.diagnostics().size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_diagnostic(data.diagnostics()[i], out);
    }
    out << ']';
    if (data.is_composite()) {
        out << ",\"components\":[";
        for (std::size_t i = 0; i < data.num_components(); ++i) {
            if (i > 0) {
                out << ',';
            }
            append_experiment_data(data.component_experiment_data(i), out);
        }
        out << ']';
    } else {
        out << ",\"trials\":" << data.trials().size();
    }
    out << '}';
}

std::ostringstream make_stream() {
    std::ostringstream out;
    out << std::setprecision(kDoublePrecision);
    return out;
}

}  // namespace

std::string to_json(const QuantumVolumeResult& result) {
    std::ostringstream out = make_stream();
    append_quantum_volume(result, out);
    return out.str();
}

std::string to_json(const CompositeAggregateResult& result) {
    std::ostringstream out = make_stream();
    append_composite(result, out);
    return out.str();
}

std::string to_json(const AnalysisResultData& result) {
    std::ostringstream out = make_stream();
    append_result(result, out);
    return out.str();
}

std::string to_json(const Diagnostic& diagnostic) {
    std::ostringstream out = make_stream();
    append_diagnostic(diagnostic, out);
    return out.str();
}

std::string to_json(const ExperimentData& data) {
    std::ostringstream out = make_stream();
    append_experiment_data(data, out);
    return out.str();
}

}  // namespace bench_analysis::service
