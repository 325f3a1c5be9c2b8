 /**
  * @file    main.cpp
  * @brief   wmscan - CLI Entry Point
  * @author  AllenK (Kwyshell)
  * @license MIT
  *
  * @details
  * Locates burned-in text watermarks in a video.
  *
  * Pipeline:
  *   import -> scene detection (ffmpeg) -> clips -> optional merge/split
  *   -> per clip: trim + sample frames -> OCR every ROI -> detections
  *
  * Usage:
  *   wmscan -i movie.mp4
  *   wmscan -i movie.mp4 --roi 0,0,320,80 -t 0.6 -o detections.csv
  *   wmscan --url https://example.com/watch?v=xyz --list-clips
  *   wmscan -i movie.mp4 --merge 2,3 --split 5:42.5
  */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return wms::cli::run(argc, argv);
}
