#include <rill/rill.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace rill;

// --- Source: a settings store broadcasting changes -----------------------------
class Settings {
public:
  void set_theme(std::string t) { theme_.accept(std::move(t)); }
  observable<std::string> theme() const { return theme_.as_observable(); }

private:
  behavior_relay<std::string> theme_{"light"};
};

// --- Screen: every subscription lives exactly as long as the screen ------------
class Screen {
public:
  Screen(std::string name, const Settings& settings) : name_(std::move(name)) {
    settings.theme().subscribe(bag_, [this](const std::string& t){
      std::cout << "[" << name_ << "] theme -> " << t << "\n";
    });
  }

  ~Screen() { std::cout << "[" << name_ << "] closed\n"; }

private:
  std::string name_;
  disposal_bag bag_;
};

int main() {
  Settings settings;

  auto main_screen = std::make_unique<Screen>("main", settings);
  {
    Screen dialog("dialog", settings);
    settings.set_theme("dark");
  }
  // the dialog's bag is gone, only "main" hears this
  settings.set_theme("solarized");

  main_screen.reset();
  settings.set_theme("nobody listens");
  return 0;
}
