#include "worker_runtime.hpp"
#include <iostream>

using namespace voxpipe;

int main(int argc, char** argv) {
    std::string type_name;
    WorkerOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](int& idx){ return (idx+1 < argc) ? std::string(argv[++idx]) : ""; };
        if (a == "--type") type_name = next(i);
        else if (a == "--vad-model") opts.backend.vad_model = next(i);
        else if (a == "--allow-fault-injection") opts.allow_fault_injection = true;
        else if (a.rfind("--fault-mode=", 0) == 0) opts.fault_mode = a.substr(13);
        else if (a == "--fault-mode") opts.fault_mode = next(i);
        else {
            std::cerr << "[Worker] unknown argument " << a << "\n";
            return 2;
        }
    }

    if (!parse_task_type(type_name, opts.type)) {
        std::cerr << "[Worker] --type must be one of transcribe, synthesize, generate-reply, "
                     "clone-voice, detect-voice-activity\n";
        return 2;
    }
    if (opts.fault_mode != "none" && opts.fault_mode != "mute" && opts.fault_mode != "no-ready") {
        std::cerr << "[Worker] unknown fault mode " << opts.fault_mode << "\n";
        return 2;
    }

    std::ios::sync_with_stdio(false);
    WorkerRuntime runtime(opts, make_backend(opts.type, opts.backend));
    return runtime.run(std::cin, std::cout);
}
