#include <catch2/catch.hpp>

#include "vidcap/command_builder.hpp"

#include <algorithm>

using namespace vidcap;

namespace {

ProjectInput two_image_project() {
  ProjectInput p;
  p.folder = "/work/ep1";
  p.voiceover = "/work/ep1/voiceover.mp3";
  p.images = {"/work/ep1/01.png", "/work/ep1/02.png"};
  return p;
}

bool has_arg(const EncodeCommand &cmd, const std::string &arg) {
  return std::find(cmd.args.begin(), cmd.args.end(), arg) != cmd.args.end();
}

/// Value following a flag, or "" if the flag is absent
std::string arg_after(const EncodeCommand &cmd, const std::string &flag) {
  auto it = std::find(cmd.args.begin(), cmd.args.end(), flag);
  if (it == cmd.args.end() || it + 1 == cmd.args.end())
    return "";
  return *(it + 1);
}

StyleDescriptor plain_style() {
  RenderSettings settings;
  return build_style(settings, {1920, 1080});
}

} // anonymous namespace

TEST_CASE("Bitrate heuristic", "[command]") {
  BitrateProfile bitrates;

  REQUIRE(bitrates.target_mbps(30, false) == 1);
  REQUIRE(bitrates.max_mbps(30, false) == 2);
  REQUIRE(bitrates.target_mbps(30, true) == 3);
  REQUIRE(bitrates.max_mbps(30, true) == 3);
  REQUIRE(bitrates.target_mbps(60, true) == 4);
  REQUIRE(bitrates.max_mbps(60, true) == 5);

  bitrates.static_base = 0.0;
  bitrates.static_per_fps = 0.0;
  REQUIRE(bitrates.target_mbps(30, false) == 1);
}

TEST_CASE("Manual crop disables hardware decode but not hardware encode",
          "[command]") {
  EncodeOptions opts;
  opts.accelerator_available = true;
  REQUIRE(CommandBuilder::accelerate_decode(opts));
  REQUIRE(CommandBuilder::accelerate_encode(opts));

  opts.manual_crop = true;
  REQUIRE_FALSE(CommandBuilder::accelerate_decode(opts));
  REQUIRE(CommandBuilder::accelerate_encode(opts));

  opts.accelerator_available = false;
  opts.manual_crop = false;
  REQUIRE_FALSE(CommandBuilder::accelerate_decode(opts));
  REQUIRE_FALSE(CommandBuilder::accelerate_encode(opts));
}

TEST_CASE("Software encode of a static project", "[command]") {
  CommandBuilder builder("ffmpeg", BitrateProfile{});
  EncodeOptions opts;
  opts.fps = 30;
  opts.quality = 23;

  auto cmd = builder.build(two_image_project(), {"prepA", "prepB"},
                           plain_style(), EffectPlan{}, 10.0,
                           "/work/ep1/temp_captions.srt", "/work/ep1/ep1.mp4",
                           opts);

  REQUIRE_FALSE(cmd.accelerated_decode);
  REQUIRE_FALSE(cmd.accelerated_encode);
  REQUIRE(cmd.args.at(0) == "ffmpeg");
  REQUIRE(cmd.args.back() == "/work/ep1/ep1.mp4");
  REQUIRE_FALSE(has_arg(cmd, "-hwaccel"));
  REQUIRE_FALSE(has_arg(cmd, "-stream_loop"));

  SECTION("each image lasts an equal share of the narration") {
    REQUIRE(std::count(cmd.args.begin(), cmd.args.end(), "5.000") == 2);
    REQUIRE(arg_after(cmd, "-loop") == "1");
    REQUIRE(arg_after(cmd, "-framerate") == "30");
  }

  SECTION("audio is the input right after the images") {
    REQUIRE(arg_after(cmd, "-filter_complex") == cmd.filter_graph);
    auto map_audio =
        std::find(cmd.args.begin(), cmd.args.end(), std::string("1:a"));
    REQUIRE(map_audio != cmd.args.end());
    REQUIRE(*(map_audio - 1) == "-map");
  }

  SECTION("libx264 settings") {
    REQUIRE(arg_after(cmd, "-c:v") == "libx264");
    REQUIRE(arg_after(cmd, "-crf") == "23");
    REQUIRE(arg_after(cmd, "-preset") == "faster");
    REQUIRE(arg_after(cmd, "-pix_fmt") == "yuv420p");
    REQUIRE(arg_after(cmd, "-c:a") == "aac");
    REQUIRE(arg_after(cmd, "-b:a") == "128k");
    REQUIRE(arg_after(cmd, "-movflags") == "+faststart");
    REQUIRE(arg_after(cmd, "-r") == "30");
  }

  SECTION("graph without effects goes straight from concat to subtitles") {
    const auto &g = cmd.filter_graph;
    REQUIRE(g.rfind("[0:v]prepA,setsar=1,fps=30[v0];"
                    "[1:v]prepB,setsar=1,fps=30[v1];"
                    "[v0][v1]concat=n=2:v=1:a=0[vconcat];"
                    "[vconcat]subtitles='/work/ep1/temp_captions.srt'",
                    0) == 0);
    REQUIRE(g.size() >= 6);
    REQUIRE(g.substr(g.size() - 6) == "[vout]");
  }
}

TEST_CASE("Transforms and overlay are chained in order", "[command]") {
  CommandBuilder builder("ffmpeg", BitrateProfile{});
  EffectPlan plan;
  plan.transforms.push_back({"Tilt", "rotate=0.1"});
  plan.overlay = OverlayEffect{"Noise", "/assets/grain.mp4", 0.3, 10.0};

  auto cmd = builder.build(two_image_project(), {"a", "b"}, plain_style(), plan,
                           10.0, "subs.srt", "out.mp4", EncodeOptions{});

  REQUIRE(arg_after(cmd, "-stream_loop") == "-1");

  const auto &g = cmd.filter_graph;
  auto fx = g.find("[vconcat]rotate=0.1[vfx]");
  auto grain =
      g.find("[3:v]scale=1920:1080,format=rgba,colorchannelmixer=aa=0.30[grain]");
  auto ov = g.find("[vfx][grain]overlay=shortest=1[vov]");
  auto subs = g.find("[vov]subtitles=");

  REQUIRE(fx != std::string::npos);
  REQUIRE(grain != std::string::npos);
  REQUIRE(ov != std::string::npos);
  REQUIRE(subs != std::string::npos);
  REQUIRE(fx < ov);
  REQUIRE(ov < subs);
}

TEST_CASE("Accelerated encode uses the device and the bitrate heuristic",
          "[command]") {
  CommandBuilder builder("/opt/ffmpeg", BitrateProfile{});
  EffectPlan plan;
  plan.transforms.push_back({"Zoom In", "zoompan=z=1"});

  EncodeOptions opts;
  opts.accelerator_available = true;
  opts.fps = 60;
  opts.quality = 18;

  auto cmd = builder.build(two_image_project(), {"a", "b"}, plain_style(), plan,
                           8.0, "subs.srt", "out.mp4", opts);

  REQUIRE(cmd.accelerated_decode);
  REQUIRE(cmd.accelerated_encode);
  REQUIRE(arg_after(cmd, "-hwaccel") == "cuda");
  REQUIRE(arg_after(cmd, "-c:v") == "h264_nvenc");
  REQUIRE(arg_after(cmd, "-cq") == "18");
  REQUIRE(arg_after(cmd, "-b:v") == "4M");
  REQUIRE(arg_after(cmd, "-maxrate") == "5M");
  REQUIRE(arg_after(cmd, "-bufsize") == "4M");
  REQUIRE_FALSE(has_arg(cmd, "-crf"));
}

TEST_CASE("Manual crop keeps the hardware encoder with software decode",
          "[command]") {
  CommandBuilder builder("ffmpeg", BitrateProfile{});
  EncodeOptions opts;
  opts.accelerator_available = true;
  opts.manual_crop = true;
  opts.fps = 30;
  opts.quality = 26;

  auto cmd = builder.build(two_image_project(), {"a", "b"}, plain_style(),
                           EffectPlan{}, 4.0, "subs.srt", "out.mp4", opts);
  REQUIRE_FALSE(cmd.accelerated_decode);
  REQUIRE(cmd.accelerated_encode);
  REQUIRE_FALSE(has_arg(cmd, "-hwaccel"));
  REQUIRE(arg_after(cmd, "-c:v") == "h264_nvenc");
  REQUIRE(arg_after(cmd, "-cq") == "26");
  REQUIRE(arg_after(cmd, "-b:v") == "1M");
  REQUIRE(arg_after(cmd, "-maxrate") == "2M");
  REQUIRE_FALSE(has_arg(cmd, "-crf"));
}

TEST_CASE("A font name with a quote and comma keeps the graph well formed",
          "[command]") {
  RenderSettings settings;
  settings.font_family = "Rock Salt, O'Neil";
  auto style = build_style(settings, {1920, 1080});

  CommandBuilder builder("ffmpeg", BitrateProfile{});
  auto cmd = builder.build(two_image_project(), {"a", "b"}, style,
                           EffectPlan{}, 4.0, "subs.srt", "out.mp4",
                           EncodeOptions{});

  const std::string &graph = cmd.filter_graph;
  auto open = graph.find("force_style='");
  REQUIRE(open != std::string::npos);
  auto close = graph.find('\'', open + 13);
  REQUIRE(graph.substr(close) == "'[vout]");
  REQUIRE(graph.find("FontName=Rock Salt ONeil,FontSize=") !=
          std::string::npos);
}

TEST_CASE("Bundled fonts are exported to the encoder environment",
          "[command]") {
  CommandBuilder builder("ffmpeg", BitrateProfile{});
  EncodeOptions opts;
  opts.fontconfig_dir = "/opt/vidcap/fonts";

  auto cmd = builder.build(two_image_project(), {"a", "b"}, plain_style(),
                           EffectPlan{}, 4.0, "subs.srt", "out.mp4", opts);

  REQUIRE(cmd.env.size() == 2);
  REQUIRE(cmd.env[0].first == "FONTCONFIG_FILE");
  REQUIRE(cmd.env[0].second == "/opt/vidcap/fonts/fonts.conf");
  REQUIRE(cmd.env[1].first == "FONTCONFIG_PATH");
  REQUIRE(cmd.env[1].second == "/opt/vidcap/fonts");
  REQUIRE(cmd.to_shell().rfind(
              "FONTCONFIG_FILE='/opt/vidcap/fonts/fonts.conf' "
              "FONTCONFIG_PATH='/opt/vidcap/fonts' 'ffmpeg' ",
              0) == 0);

  auto plain = builder.build(two_image_project(), {"a", "b"}, plain_style(),
                             EffectPlan{}, 4.0, "subs.srt", "out.mp4",
                             EncodeOptions{});
  REQUIRE(plain.env.empty());
  REQUIRE(plain.to_shell().rfind("'ffmpeg' ", 0) == 0);
}

TEST_CASE("Filter path escaping", "[command]") {
  REQUIRE(escape_filter_path("C:\\clips\\subs.srt") == "C\\:/clips/subs.srt");
  REQUIRE(escape_filter_path("/tmp/it's.srt") == "/tmp/it'\\''s.srt");
  REQUIRE(escape_filter_path("/plain/path.srt") == "/plain/path.srt");
}

TEST_CASE("Shell command quoting", "[command]") {
  REQUIRE(shell_quote("plain") == "'plain'");
  REQUIRE(shell_quote("it's") == "'it'\\''s'");

  EncodeCommand cmd;
  cmd.args = {"ffmpeg", "-i", "my file.mp3"};
  REQUIRE(cmd.to_shell() == "'ffmpeg' '-i' 'my file.mp3'");
}
