#include "report_generator.hpp"
#include "../../../libkbfit/include/logger.hpp"
#include <format>
#include <fstream>
#include <iostream>
#include <regex>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

std::string outcome_label(const Result& r) {
    if (!r.success) return "FAIL";
    if (!r.meets_target) return r.written ? "FORCED" : "OVER TARGET";
    return r.written ? "OK" : "OK (dry-run)";
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string format_trail(const std::vector<kbfit::ProbeRecord>& trail) {
    std::string out;
    for (size_t i = 0; i < trail.size(); ++i) {
        out += std::format("q={}:{}{}", trail[i].quality, trail[i].size, trail[i].feasible ? "<=" : ">");
        if (i + 1 < trail.size()) out += "; ";
    }
    return out;
}

void print_console_report(const Result& r) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stdout_a_tty();

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::string outcome = outcome_label(r);
    if (use_colors) {
        const char* color = !r.success ? "\033[1;31m" : r.meets_target ? "\033[1;32m" : "\033[1;33m";
        outcome = color + outcome + "\033[0m";
    }

    const double pct = r.success && r.size_before
                     ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
                     : 0.0;
    const std::string delta = r.success ? std::format("{:.2f}%", pct) : "-";
    const std::string quality = r.quality ? std::to_string(*r.quality) : "-";

    // label column plus a single value column
    constexpr size_t label_width = 14;
    const size_t value_width = term_width > label_width + 10 ? term_width - label_width : 40;
    const std::string row_fmt = "{:<" + std::to_string(label_width) + "}{}\n";

    auto row = [&](const std::string& label, const std::string& value) {
        std::cout << std::vformat(row_fmt, std::make_format_args(label, value));
    };

    std::cout << "\n";
    row("File", truncate(r.input.filename().string(), value_width));
    row("Format", r.format);
    if (r.width > 0) {
        row("Dimensions", std::format("{}x{}", r.width, r.height));
    }
    row("Target(KB)", std::format("{:.1f}", static_cast<double>(r.target) / 1024.0));
    row("Before(KB)", std::format("{:.1f}", static_cast<double>(r.size_before) / 1024.0));
    row("After(KB)", std::format("{:.1f}", static_cast<double>(r.size_after) / 1024.0));
    row("Delta(%)", delta);
    row("Quality", quality);
    row("Encodes", std::to_string(r.iterations));
    row("Reason", r.reason.empty() ? "-" : r.reason);
    row("Time(s)", std::format("{:.2f}", r.seconds));
    row("Result", outcome);
    if (!r.output.empty()) {
        row("Output", truncate(r.output.string(), value_width));
    }
    if (!r.error_msg.empty()) {
        row("Error", strip_ansi(r.error_msg));
    }
}

bool export_csv_report(const Result& r, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        kbfit::Logger::log(kbfit::LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "File,Output,Format,Width,Height,Target(B),Before(B),After(B),Quality,Encodes,"
           "Reason,MeetsTarget,Time(s),Result,Trail,Error\n";

    out << csv_escape(r.input.filename().string()) << ","
        << csv_escape(r.output.string()) << ","
        << r.format << ","
        << r.width << ","
        << r.height << ","
        << r.target << ","
        << r.size_before << ","
        << r.size_after << ","
        << (r.quality ? std::to_string(*r.quality) : "") << ","
        << r.iterations << ","
        << r.reason << ","
        << (r.meets_target ? "yes" : "no") << ","
        << std::format("{:.3f}", r.seconds) << ","
        << outcome_label(r) << ","
        << csv_escape(format_trail(r.trail)) << ","
        << csv_escape(r.error_msg) << "\n";

    out.flush();
    if (!out) {
        kbfit::Logger::log(kbfit::LogLevel::Error, "Write error on report: " + output_path.string(), "report");
        return false;
    }
    return true;
}
