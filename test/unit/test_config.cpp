#include "test_helpers.hpp"

#include <fstream>
#include <limits>

namespace SaveLoad = Reverie::Common::SaveLoad;
using Reverie::DreamOptions;
using Reverie::Config::Settings;

static std::filesystem::path writeFile(const std::string& name, const std::string& contents) {
  auto path = tempDir() / name;
  std::ofstream stream(path);
  stream << contents;
  return path;
}

static void testDefaults() {
  std::cout << "  testDefaults... ";

  Settings settings;
  CHECK(settings.dream.progress, "Defaults: progress on");
  CHECK(settings.dream.scale == 4 && settings.dream.per_octave == 2, "Defaults: four octaves, two per halving");
  CHECK(settings.dream.steps == 10 && settings.dream.jitter == 32, "Defaults: ten steps, jitter 32");
  CHECK(settings.dream.step_size == 1.5 && settings.dream.max_tile_size == 512, "Defaults: step 1.5, tiles of 512");
  CHECK(settings.network.input_layer == "data" && !settings.network.gpu.has_value(), "Defaults: data input on the CPU");
  CHECK_NEAR(settings.network.normalization.mean[0], 103.939f, 1e-4f, "Defaults: BGR mean");
  CHECK(settings.network.normalization.reverse_channels, "Defaults: channel reversal on");
  CHECK(settings.end_layer == "inception_4c/output", "Defaults: end layer");
  std::cout << std::endl;
}

static void testSaveThenLoad() {
  std::cout << "  testSaveThenLoad... ";

  Settings settings;
  settings.dream.scale = 2;
  settings.dream.steps = 7;
  settings.dream.step_size = 0.75;
  settings.dream.progress = false;
  settings.network.model_path = "models/googlenet_places.pt";
  settings.network.gpu = 1;
  settings.network.normalization.mean = {104.0f, 117.0f, 123.0f};
  settings.end_layer = "inception_3b/5x5_reduce";
  settings.log_level = Reverie::Utils::Log::Level::Debug;

  const auto path = tempDir() / "settings.json";
  SaveLoad::SaveSettings(settings, path);
  auto loaded = SaveLoad::LoadSettings(path);

  CHECK(loaded.dream.scale == 2 && loaded.dream.steps == 7, "Saved: integer options");
  CHECK(loaded.dream.step_size == 0.75 && !loaded.dream.progress, "Saved: step size and progress");
  CHECK(loaded.network.model_path == "models/googlenet_places.pt", "Saved: model path");
  CHECK(loaded.network.gpu.has_value() && *loaded.network.gpu == 1, "Saved: device");
  CHECK_NEAR(loaded.network.normalization.mean[1], 117.0f, 1e-4f, "Saved: mean");
  CHECK(loaded.end_layer == "inception_3b/5x5_reduce", "Saved: end layer");
  CHECK(loaded.log_level == Reverie::Utils::Log::Level::Debug, "Saved: log level");
  std::cout << std::endl;
}

static void testPartialFile() {
  std::cout << "  testPartialFile... ";

  auto path = writeFile("partial.json", R"({"dream": {"steps": "3"}, "network": {"device": "CUDA"}})");
  auto loaded = SaveLoad::LoadSettings(path);

  CHECK(loaded.dream.steps == 3, "Partial: present key read");
  CHECK(loaded.dream.scale == 4 && loaded.dream.jitter == 32, "Partial: absent keys keep defaults");
  CHECK(loaded.network.gpu.has_value() && *loaded.network.gpu == 0, "Partial: bare cuda is device 0");
  CHECK(loaded.end_layer == "inception_4c/output", "Partial: default end layer");
  std::cout << std::endl;
}

static void testMalformedFiles() {
  std::cout << "  testMalformedFiles... ";

  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("bad_scale.json", R"({"dream": {"scale": "many"}})")),
               std::runtime_error, "Malformed: non-numeric scale");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("bad_device.json", R"({"network": {"device": "tpu"}})")),
               std::runtime_error, "Malformed: unknown device");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("huge_device.json", R"({"network": {"device": "cuda:99999999999"}})")),
               std::runtime_error, "Malformed: device index out of range");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("bad_mean.json", R"({"network": {"mean": ["1", "2"]}})")),
               std::runtime_error, "Malformed: mean of two values");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("bad_level.json", R"({"log_level": "chatty"})")),
               std::runtime_error, "Malformed: unknown log level");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("bad_json.json", "{ not json")),
               std::runtime_error, "Malformed: invalid JSON");
  CHECK_THROWS(SaveLoad::LoadSettings(writeFile("zero_scale.json", R"({"dream": {"scale": "0"}})")),
               std::invalid_argument, "Malformed: out-of-range option");
  std::cout << std::endl;
}

static void testValidate() {
  std::cout << "  testValidate... ";

  using Reverie::Config::Validate;
  DreamOptions options;
  bool accepted = true;
  try {
    Validate(options);
  } catch (const std::exception&) {
    accepted = false;
  }
  CHECK(accepted, "Validate: defaults accepted");

  auto rejects = [](DreamOptions bad) {
    try {
      Validate(bad);
    } catch (const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  DreamOptions bad;
  bad.scale = 0;
  CHECK(rejects(bad), "Validate: zero scale");
  bad = {};
  bad.per_octave = 0;
  CHECK(rejects(bad), "Validate: zero per_octave");
  bad = {};
  bad.steps = -1;
  CHECK(rejects(bad), "Validate: negative steps");
  bad = {};
  bad.jitter = -2;
  CHECK(rejects(bad), "Validate: negative jitter");
  bad = {};
  bad.max_tile_size = 0;
  CHECK(rejects(bad), "Validate: zero tile size");
  bad = {};
  bad.step_size = std::numeric_limits<double>::infinity();
  CHECK(rejects(bad), "Validate: infinite step size");
  std::cout << std::endl;
}

void runConfigTests() {
  testDefaults();
  testSaveThenLoad();
  testPartialFile();
  testMalformedFiles();
  testValidate();
}
