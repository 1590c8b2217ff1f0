#include "test_helpers.hpp"

int testsPassed = 0;
int testsFailed = 0;

void runCodecTests();
void runResizeTests();
void runAdapterTests();
void runTilingTests();
void runOctaveTests();
void runProgressTests();
void runConfigTests();
void runDreamerTests();

int main()
{
  // Warnings stay visible, per-run Info chatter does not.
  Reverie::Utils::Log::SetLevel(Reverie::Utils::Log::Level::Warning);

  std::cout << "=== Codec Tests ===" << std::endl;
  runCodecTests();

  std::cout << std::endl;
  std::cout << "=== Resize Tests ===" << std::endl;
  runResizeTests();

  std::cout << std::endl;
  std::cout << "=== Adapter Tests ===" << std::endl;
  runAdapterTests();

  std::cout << std::endl;
  std::cout << "=== Tiling Tests ===" << std::endl;
  runTilingTests();

  std::cout << std::endl;
  std::cout << "=== Octave Tests ===" << std::endl;
  runOctaveTests();

  std::cout << std::endl;
  std::cout << "=== Progress Tests ===" << std::endl;
  runProgressTests();

  std::cout << std::endl;
  std::cout << "=== Config Tests ===" << std::endl;
  runConfigTests();

  std::cout << std::endl;
  std::cout << "=== Dreamer Tests ===" << std::endl;
  runDreamerTests();

  cleanupTemp();

  std::cout << std::endl;
  std::cout << "=== Results: " << testsPassed << " passed, " << testsFailed << " failed ===" << std::endl;
  return (testsFailed > 0) ? 1 : 0;
}
