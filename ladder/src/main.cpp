/*
 * 설명: 래더 프로세스 진입점. 인자가 없거나 run이면 스케줄 루프, 그 외에는 일회성 작업을 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <exception>
#include <iostream>
#include <string>

#include "ladder/app.hpp"

int main(int argc, char** argv) {
  using namespace ladder;
  std::string job = argc > 1 ? argv[1] : "run";
  try {
    LadderConfig config = LoadConfigFromEnv();
    LadderApp app(config);
    if (job == "run") {
      app.Run();
      return 0;
    }
    return app.RunJob(job);
  } catch (const std::exception& ex) {
    std::cerr << "래더 작업 실패(" << job << "): " << ex.what() << "\n";
    return 1;
  }
}
