#include "test_helpers.hpp"

#include <opencv2/core.hpp>

using Reverie::DreamOptions;
using Reverie::Dreamer;

static DreamOptions quietOptions(int64_t scale, int64_t steps) {
  DreamOptions options;
  options.progress = false;
  options.scale = scale;
  options.steps = steps;
  return options;
}

static void testLayers() {
  std::cout << "  testLayers... ";

  Dreamer dreamer(makeFixedAdapter());
  auto layers = dreamer.layers();
  CHECK(layers.size() == 5 && layers.front() == "data" && layers.back() == "conv2", "Layers: every end layer listed");
  CHECK_THROWS((void)Dreamer(nullptr), std::invalid_argument, "Layers: null adapter rejected");
  std::cout << std::endl;
}

static void testGreyImageEndToEnd() {
  std::cout << "  testGreyImageEndToEnd... ";

  Dreamer dreamer(makeFixedAdapter());
  auto grey = torch::full({256, 256, 3}, 128, torch::kUInt8);
  auto result = dreamer.dream(grey, "conv2", quietOptions(1, 1));

  CHECK(result.scalar_type() == torch::kUInt8, "End to end: uint8 output");
  CHECK(result.sizes() == torch::IntArrayRef({256, 256, 3}), "End to end: input size kept");
  CHECK(!torch::equal(result, grey), "End to end: the dream changed the image");
  CHECK(torch::equal(grey, torch::full({256, 256, 3}, 128, torch::kUInt8)), "End to end: input untouched");
  std::cout << std::endl;
}

static void testMatInput() {
  std::cout << "  testMatInput... ";

  Dreamer dreamer(makeFixedAdapter());
  cv::Mat image(40, 52, CV_8UC3, cv::Scalar(90, 128, 200));
  cv::Mat result = dreamer.dream(image, "pool1", quietOptions(2, 2));

  CHECK(result.type() == CV_8UC3, "Mat: 8-bit BGR output");
  CHECK(result.rows == 40 && result.cols == 52, "Mat: size kept");
  CHECK(cv::norm(image, result, cv::NORM_INF) > 0.0, "Mat: pixels changed");

  cv::Mat floating;
  image.convertTo(floating, CV_32FC3);
  cv::Mat fromFloat = dreamer.dream(floating, "pool1", quietOptions(2, 2));
  CHECK(cv::norm(result, fromFloat, cv::NORM_INF) == 0.0, "Mat: 8-bit and float inputs dream alike");
  std::cout << std::endl;
}

static void testDeterministicDreams() {
  std::cout << "  testDeterministicDreams... ";

  Dreamer dreamer(makeFixedAdapter());
  torch::manual_seed(9);
  auto image = torch::randint(0, 256, {48, 40, 3}, torch::kUInt8);
  auto options = quietOptions(3, 2);
  options.max_tile_size = 24;

  auto first = dreamer.dream(image, "conv2", options);
  auto second = dreamer.dream(image, "conv2", options);
  CHECK(torch::equal(first, second), "Determinism: repeated dreams are bit-identical");
  std::cout << std::endl;
}

static void testProgressFactory() {
  std::cout << "  testProgressFactory... ";

  Dreamer dreamer(makeFixedAdapter());
  auto record = std::make_shared<SinkRecord>();
  dreamer.set_progress_factory(recordingFactory(record));

  DreamOptions options = quietOptions(2, 1);
  options.progress = true;
  options.per_octave = 1;
  (void)dreamer.dream(torch::full({32, 32, 3}, 100.0), "conv2", options);

  const int64_t expected = 32 * 32 + 16 * 16;
  CHECK(record->created == 1, "Progress: one sink per dream");
  CHECK(record->initialTotal == expected, "Progress: total over both octaves");
  CHECK(record->advanced == expected, "Progress: every pixel reported");
  CHECK(record->closed == 1, "Progress: sink closed");

  options.progress = false;
  (void)dreamer.dream(torch::full({32, 32, 3}, 100.0), "conv2", options);
  CHECK(record->created == 1, "Progress: no sink when disabled");
  std::cout << std::endl;
}

static void testSinkClosedOnFailure() {
  std::cout << "  testSinkClosedOnFailure... ";

  // Second forward call fails, after the first tile has already been reported.
  auto calls = std::make_shared<int>(0);
  std::vector<Reverie::Network::Stage> stages{
    {"scale", [](const torch::Tensor& input) { return input * 0.5; }},
    {"flaky", [calls](const torch::Tensor& input) {
       if (++*calls == 2)
         throw std::runtime_error("device lost");
       return input * input;
     }},
  };
  auto adapter = std::make_unique<Reverie::Network::StagedAdapter>(
    std::move(stages), "data", Reverie::Network::Normalization{}, torch::Device(torch::kCPU));

  Dreamer dreamer(std::move(adapter));
  auto record = std::make_shared<SinkRecord>();
  dreamer.set_progress_factory(recordingFactory(record, true));
  DreamOptions options = quietOptions(1, 2);
  options.progress = true;

  bool sawOriginalError = false;
  try {
    (void)dreamer.dream(torch::rand({8, 8, 3}) * 255.0, "flaky", options);
  } catch (const std::runtime_error& error) {
    sawOriginalError = std::string(error.what()) == "device lost";
  }
  CHECK(sawOriginalError, "Failure: original error propagated, not the close failure");
  CHECK(record->created == 1 && record->closed == 1, "Failure: sink still closed");
  std::cout << std::endl;
}

static void testRejectsBadRequests() {
  std::cout << "  testRejectsBadRequests... ";

  Dreamer dreamer(makeFixedAdapter());
  auto record = std::make_shared<SinkRecord>();
  dreamer.set_progress_factory(recordingFactory(record));
  auto image = torch::full({16, 16, 3}, 128.0);

  DreamOptions options;
  CHECK_THROWS((void)dreamer.dream(image, "inception_4c/output", options), std::out_of_range, "Reject: unknown end layer");
  options.scale = 0;
  CHECK_THROWS((void)dreamer.dream(image, "conv2", options), std::invalid_argument, "Reject: zero scale");
  options = {};
  options.max_tile_size = -4;
  CHECK_THROWS((void)dreamer.dream(image, "conv2", options), std::invalid_argument, "Reject: negative tile size");
  options = {};
  CHECK_THROWS((void)dreamer.dream(torch::zeros({16, 16}), "conv2", options), Reverie::InvalidShape, "Reject: grey tensor");
  CHECK(record->created == 0, "Reject: nothing computed");
  std::cout << std::endl;
}

void runDreamerTests() {
  testLayers();
  testGreyImageEndToEnd();
  testMatInput();
  testDeterministicDreams();
  testProgressFactory();
  testSinkClosedOnFailure();
  testRejectsBadRequests();
}
