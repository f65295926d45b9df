#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "infrastructure/WhisperCliAdapter.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using whisperim::domain::Backend;
using whisperim::domain::Failure;
using whisperim::domain::FailureKind;
using whisperim::domain::Settings;
using whisperim::infrastructure::WhisperCliAdapter;
using whisperim::infrastructure::WhisperCliOptions;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

fs::path WriteScript(const fs::path& path, const std::string& body) {
    WriteFile(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return fs::absolute(path);
}

std::string ReadFile(const fs::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WhisperCliAdapter Test..." << std::endl;

    const fs::path testRoot = fs::absolute("test_root_whisper");
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "models");
    fs::create_directories(testRoot / "bin");
    WriteFile(testRoot / "models" / "ggml-base.bin", "weights");
    WriteFile(testRoot / "audio.wav", std::string(2048, '\0'));
    const std::string audio = (testRoot / "audio.wav").string();

    // Argument list.
    {
        Settings settings;
        const auto args = WhisperCliAdapter::BuildArguments("/m/ggml-base.bin", settings, "/tmp/a.wav");
        const std::vector<std::string> expected = {
            "-m", "/m/ggml-base.bin", "-l", "zh", "-t", "4", "-nt", "-np", "-f", "/tmp/a.wav"};
        assert(args == expected);

        settings.backend = Backend::OpenVINO;
        settings.model = "small";
        settings.threads = 8;
        settings.language = "auto";
        const auto ovArgs = WhisperCliAdapter::BuildArguments("/m/ggml-small.bin", settings, "/tmp/a.wav");
        const std::vector<std::string> ovExpected = {
            "-m", "/m/ggml-small.bin", "-l", "auto", "-t", "8", "-nt", "-np", "-oved", "CPU", "-f", "/tmp/a.wav"};
        assert(ovArgs == ovExpected);
    }
    std::cout << "[PASS] Argument lists." << std::endl;

    // Executable missing from PATH and fallback location.
    {
        WhisperCliOptions options;
        options.executableName = "whisper-im-no-such-cli";
        options.fallbackExecutable = (testRoot / "missing" / "whisper-cli").string();
        WhisperCliAdapter adapter(options);
        assert(!adapter.LocateExecutable());

        Settings settings;
        settings.modelsDir = (testRoot / "models").string();
        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::ToolNotFound);
        assert(Contains(failure.message, "not found"));
    }
    std::cout << "[PASS] ToolNotFound." << std::endl;

    const fs::path fakeCli = WriteScript(testRoot / "bin" / "whisper-cli",
                                         "echo \"$@\" > \"$(dirname \"$0\")/args.txt\"\n"
                                         "printf ' 這是測試 hello\\n'\n");

    // Fallback location is used when PATH has nothing.
    {
        WhisperCliOptions options;
        options.executableName = "whisper-im-no-such-cli";
        options.fallbackExecutable = fakeCli.string();
        WhisperCliAdapter adapter(options);
        auto located = adapter.LocateExecutable();
        assert(located && *located == fakeCli);
    }
    std::cout << "[PASS] Fallback executable." << std::endl;

    WhisperCliOptions options;
    options.executableName = fakeCli.string();
    options.defaultModelsDir = (testRoot / "no-default-models").string();

    // Successful run: stdout verbatim, arguments as expected.
    {
        WhisperCliAdapter adapter(options);
        Settings settings;
        settings.modelsDir = (testRoot / "models").string();

        std::string transcript;
        Failure failure;
        assert(adapter.transcribe(audio, settings, transcript, failure));
        assert(!failure.isSet());
        assert(transcript == " 這是測試 hello\n");

        const std::string args = ReadFile(testRoot / "bin" / "args.txt");
        const std::string model = (testRoot / "models" / "ggml-base.bin").string();
        assert(args == "-m " + model + " -l zh -t 4 -nt -np -f " + audio + "\n");
    }
    std::cout << "[PASS] Transcript returned verbatim." << std::endl;

    // Models dir falls back to the default directory.
    {
        WhisperCliOptions fallbackOptions = options;
        fallbackOptions.defaultModelsDir = (testRoot / "models").string();
        WhisperCliAdapter adapter(fallbackOptions);
        Settings settings;
        settings.modelsDir = (testRoot / "elsewhere").string();
        Failure failure;
        auto model = adapter.ResolveModel(settings, failure);
        assert(model && *model == testRoot / "models" / "ggml-base.bin");
    }
    std::cout << "[PASS] Default models directory." << std::endl;

    // Missing model.
    {
        WhisperCliAdapter adapter(options);
        Settings settings;
        settings.modelsDir = (testRoot / "models").string();
        settings.model = "small";
        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::ModelNotFound);
        assert(Contains(failure.message, "ggml-small.bin"));
        assert(Contains(failure.message, "Settings"));
    }
    std::cout << "[PASS] ModelNotFound." << std::endl;

    // OpenVINO needs the encoder pair.
    {
        WhisperCliAdapter adapter(options);
        Settings settings;
        settings.backend = Backend::OpenVINO;
        settings.modelsDir = (testRoot / "models").string();

        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::ModelNotFound);
        assert(Contains(failure.message, "ggml-base-encoder-openvino.xml"));

        WriteFile(testRoot / "models" / "ggml-base-encoder-openvino.xml", "<xml/>");
        failure.clear();
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::ModelNotFound);

        WriteFile(testRoot / "models" / "ggml-base-encoder-openvino.bin", "encoder");
        failure.clear();
        assert(adapter.transcribe(audio, settings, transcript, failure));
        assert(Contains(ReadFile(testRoot / "bin" / "args.txt"), "-oved CPU"));
    }
    std::cout << "[PASS] OpenVINO encoder check." << std::endl;

    // Missing audio.
    {
        WhisperCliAdapter adapter(options);
        Settings settings;
        settings.modelsDir = (testRoot / "models").string();
        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe((testRoot / "nope.wav").string(), settings, transcript, failure));
        assert(failure.kind == FailureKind::TranscriptionError);
    }
    std::cout << "[PASS] Missing audio." << std::endl;

    // Nonzero exit carries stderr.
    {
        const fs::path failing = WriteScript(testRoot / "bin" / "failing-cli", "echo 'boom: bad model' >&2\nexit 2\n");
        WhisperCliOptions failingOptions = options;
        failingOptions.executableName = failing.string();
        WhisperCliAdapter adapter(failingOptions);
        Settings settings;
        settings.modelsDir = (testRoot / "models").string();
        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::TranscriptionError);
        assert(Contains(failure.message, "boom: bad model"));
    }
    std::cout << "[PASS] Nonzero exit yields TranscriptionError." << std::endl;

    // Timeout.
    {
        const fs::path slow = WriteScript(testRoot / "bin" / "slow-cli", "exec sleep 10\n");
        WhisperCliOptions slowOptions = options;
        slowOptions.executableName = slow.string();
        slowOptions.timeout = 300ms;
        WhisperCliAdapter adapter(slowOptions);
        Settings settings;
        settings.modelsDir = (testRoot / "models").string();
        std::string transcript;
        Failure failure;
        assert(!adapter.transcribe(audio, settings, transcript, failure));
        assert(failure.kind == FailureKind::TranscriptionError);
        assert(failure.message == "Transcribe timeout");
    }
    std::cout << "[PASS] Timeout yields TranscriptionError." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
