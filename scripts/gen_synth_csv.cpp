#include <fmt/format.h>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>

// Writes a mixed-type fixture with a few sensitive-looking columns and some nulls.
int main(int argc, char** argv){
  if (argc < 4){
    fmt::print(stderr, "usage: gen_synth_csv <out.csv> <rows> <quoted:0|1> [seed]\n");
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";
  const std::uint64_t seed = argc > 4 ? std::strtoull(argv[4], nullptr, 10) : 42;

  std::ofstream f(out, std::ios::binary);
  if (!f){ fmt::print(stderr, "open failed: {}\n", out); return 2; }

  // header
  f << "id,name,email,age,balance,active,city,notes\n";

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int> age(18, 90);
  std::uniform_real_distribution<double> balance(-500.0, 25000.0);
  std::uniform_int_distribution<int> pct(0, 99);
  const char* first[] = {"alice","bruno","chen","dana","emeka","fatima","goran","hana"};
  const char* cities[] = {"Lisbon","Osaka","Lagos","Quito","Tallinn"};

  auto emit = [&](const std::string& x){
    if (!quoted) { f << x; return; }
    // quote & escape inner quotes
    f << '"';
    for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
    f << '"';
  };

  for (std::uint64_t i=1;i<=rows;++i){
    const std::string name = first[rng() % 8];
    emit(std::to_string(i)); f << ",";
    emit(name + " " + std::string(1, static_cast<char>('A' + rng() % 26)) + "."); f << ",";
    emit(fmt::format("{}{}@example.org", name, i)); f << ",";
    emit(pct(rng) < 5 ? std::string{} : std::to_string(age(rng))); f << ",";
    emit(fmt::format("{:.2f}", balance(rng))); f << ",";
    emit((i % 3) == 0 ? "true" : "false"); f << ",";
    emit(pct(rng) < 10 ? "NA" : cities[rng() % 5]); f << ",";
    std::string note = fmt::format("note {}", i * 7919 % 1000);
    // Add some commas/quotes occasionally when quoted mode is on
    if (quoted && (i % 17 == 0)) note += ", said \"hi\"";
    emit(note);
    f << "\n";
  }
  fmt::print(stderr, "wrote {} rows to {}\n", rows, out);
  return 0;
}
