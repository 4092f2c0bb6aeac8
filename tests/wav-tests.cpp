#include "wav.h"

#include "testing.h"

#include <QTemporaryDir>

namespace {

void test_compute_peaks()
{
  const std::vector<int16_t> samples{0, 100, -200, 300, -32768, 32767, 10, -10};

  WaveformPeaks peaks = computePeaks(samples, 4);
  require(peaks.size() == 4, "bucket count");
  require(peaks[0].min == 0 && peaks[0].max == 100 / 32768.f, "first bucket");
  require(peaks[1].min == -200 / 32768.f && peaks[1].max == 300 / 32768.f, "second bucket");
  require(peaks[2].min == -1.f, "full scale negative");
  require(peaks[3].max == 10 / 32768.f, "last bucket");

  require(computePeaks(samples, 100).size() == samples.size(), "at most one sample per bucket");
  require(computePeaks({}, 10).empty(), "no sample");
  require(computePeaks(samples, 0).empty(), "no bucket");
}

void test_extract_peaks()
{
  QTemporaryDir dir;
  require(dir.isValid(), "temporary directory");

  std::vector<int16_t> samples(44100);
  for (size_t i(0); i < samples.size(); ++i)
  {
    samples[i] = int16_t(i < samples.size() / 2 ? 1000 : -2000);
  }

  const QString path = dir.filePath("mono.wav");
  writeWav(path, samples);

  WaveformPeaks peaks = extractPeaks(path, 10);
  require(peaks.size() == 10, "peaks extracted");
  require(peaks.front().max == 1000 / 32768.f, "first half");
  require(peaks.back().min == -2000 / 32768.f, "second half");
}

void test_unsupported_input()
{
  QTemporaryDir dir;

  const QString stereo = dir.filePath("stereo.wav");
  writeWav(stereo, std::vector<int16_t>(200, 5), 2);
  require(extractPeaks(stereo, 10).empty(), "stereo rejected");

  const QString garbage = dir.filePath("garbage.wav");
  QFile file{garbage};
  require(file.open(QIODevice::WriteOnly), "create garbage file");
  file.write("this is not a wav file at all");
  file.close();
  require(extractPeaks(garbage, 10).empty(), "garbage rejected");

  require(extractPeaks(dir.filePath("missing.wav"), 10).empty(), "missing file");
}

} // namespace

int main()
{
  test_compute_peaks();
  test_extract_peaks();
  test_unsupported_input();
  return 0;
}
