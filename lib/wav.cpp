#include "wav.h"

#include <QFile>

#include <QDebug>

#include <algorithm>
#include <limits>
#include <string>

struct WavHeader
{
  char chunk_ID[4];    //  4  riff_mark[4];
  uint32_t chunk_size; //  4  file_size;
  char format[4];      //  4  wave_str[4];
};

struct ChunkHeader
{
  char chunk_ID[4];
  uint32_t chunk_size;
};

struct FmtChunk
{
  uint16_t audio_format;    //  2  pcm_encode;
  uint16_t num_channels;    //  2  sound_channel;
  uint32_t sample_rate;     //  4  pcm_sample_freq;
  uint32_t byte_rate;       //  4  byte_freq;
  uint16_t block_align;     //  2  block_align;
  uint16_t bits_per_sample; //  2  sample_bits;
};

static bool read_struct(QFile& file, void* dest, qint64 size)
{
  return file.read(reinterpret_cast<char*>(dest), size) == size;
}

static bool read_wav_samples(QFile& file, std::vector<int16_t>& samples)
{
  WavHeader header;
  if (!read_struct(file, &header, sizeof(WavHeader)))
  {
    qDebug() << "truncated header in" << file.fileName();
    return false;
  }

  if (std::string(header.chunk_ID, 4) != "RIFF" || std::string(header.format, 4) != "WAVE")
  {
    qDebug() << "Not a RIFF/WAVE file:" << file.fileName();
    return false;
  }

  FmtChunk fmt{};
  bool has_fmt = false;

  while (!file.atEnd())
  {
    ChunkHeader chkheader;
    if (!read_struct(file, &chkheader, sizeof(ChunkHeader)))
    {
      break;
    }

    const std::string id{chkheader.chunk_ID, 4};

    if (id == "fmt ")
    {
      if (chkheader.chunk_size < sizeof(FmtChunk) || !read_struct(file, &fmt, sizeof(FmtChunk)))
      {
        qDebug() << "bad fmt chunk";
        return false;
      }

      has_fmt = true;
      file.seek(file.pos() + (chkheader.chunk_size - sizeof(FmtChunk)));
    }
    else if (id == "data")
    {
      if (!has_fmt)
      {
        qDebug() << "data chunk before fmt chunk";
        return false;
      }

      if (fmt.audio_format != 1 || fmt.num_channels != 1 || fmt.bits_per_sample != 16)
      {
        qDebug() << "Only mono 16-bit PCM wav are supported ( channels:" << fmt.num_channels
                 << ", bits:" << fmt.bits_per_sample << ")";
        return false;
      }

      // ffmpeg writes 0xFFFFFFFF as size when streaming to a pipe
      const qint64 available = file.size() - file.pos();
      const qint64 size = std::min<qint64>(chkheader.chunk_size, available);

      samples.resize(size / sizeof(int16_t));
      const qint64 nbytes = qint64(samples.size() * sizeof(int16_t));
      if (file.read(reinterpret_cast<char*>(samples.data()), nbytes) != nbytes)
      {
        qDebug() << "truncated data chunk";
        return false;
      }

      qDebug() << "FileName:" << file.fileName();
      qDebug() << "Sample Rate: " << fmt.sample_rate << " Hz";
      qDebug() << "Estimated length: " << samples.size() / double(fmt.sample_rate)
               << " seconds";

      return true;
    }
    else
    {
      qDebug() << "skipping unknown chunk " << id.c_str();
      file.seek(file.pos() + chkheader.chunk_size);
    }
  }

  qDebug() << "no data chunk in" << file.fileName();
  return false;
}

WaveformPeaks extractPeaks(const QString& filePath, int bucketCount)
{
  QFile file{filePath};
  if (!file.open(QIODevice::ReadOnly))
  {
    qDebug() << "could not open" << filePath;
    return {};
  }

  std::vector<int16_t> samples;
  if (!read_wav_samples(file, samples))
  {
    return {};
  }

  return computePeaks(samples, bucketCount);
}

WaveformPeaks computePeaks(const std::vector<int16_t>& samples, int bucketCount)
{
  if (samples.empty() || bucketCount <= 0)
  {
    return {};
  }

  const size_t nbuckets = std::min(samples.size(), size_t(bucketCount));

  WaveformPeaks result;
  result.reserve(nbuckets);

  constexpr float scale = -float(std::numeric_limits<int16_t>::min());

  for (size_t i(0); i < nbuckets; ++i)
  {
    const size_t start_index = i * samples.size() / nbuckets;
    const size_t end_index = (i + 1) * samples.size() / nbuckets;

    const auto begin = samples.begin() + start_index;
    const auto end = samples.begin() + end_index;
    const auto [minit, maxit] = std::minmax_element(begin, end);

    WavePeak peak;
    peak.min = *minit / scale;
    peak.max = *maxit / scale;
    result.push_back(peak);
  }

  return result;
}
