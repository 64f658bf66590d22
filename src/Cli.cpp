#include "deploy_wrapper/Cli.hpp"
#include "deploy_wrapper/Strings.hpp"

#include <iomanip>
#include <string_view>

namespace deploywrap {
	//------------------------------------------------------------
	//	Отделение ключа от префикса "-" / "--".
	//	Возвращает false, если аргумент не является ключом
	//------------------------------------------------------------
	static bool stripDashes(std::string_view& s) {
		if (s.size() < 2 || s.front() != '-') return false;
		s.remove_prefix(s[1] == '-' ? 2 : 1);
		return !s.empty();
	}
	//------------------------------------------------------------
	//	Установка ошибки разбора
	//------------------------------------------------------------
	static CliOptions& invalid(CliOptions& o, const std::string& why) {
		o.cmd = Command::Invalid;
		o.error = why;
		return o;
	}
	//------------------------------------------------------------
	//	Разбор опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, const char* const* argv) {

		CliOptions o;
		bool help = false;
		bool version = false;
		bool haveTarget = false;

		for (int i = 1; i < argc; i++)
		{
			const std::string_view raw = argv[i];
			std::string_view key = raw;

			if (!stripDashes(key))
			{
				if (raw == "/?") { help = true; continue; }
				return invalid(o, "Unexpected argument: " + std::string(raw));
			}

			//---Значение в форме -Key=value
			std::string_view inlineValue;
			bool hasInlineValue = false;
			const size_t eq = key.find('=');
			if (eq != std::string_view::npos)
			{
				inlineValue = key.substr(eq + 1);
				key = key.substr(0, eq);
				hasInlineValue = true;
			}

			//---Флаги-переключатели
			bool* sw = nullptr;
			if (iequals(key, "Install")) sw = &o.request.install;
			else if (iequals(key, "Uninstall")) sw = &o.request.uninstall;
			else if (iequals(key, "DoNotDisturb")) sw = &o.request.doNotDisturb;
			else if (iequals(key, "ForceInteractive")) sw = &o.request.forceInteractive;
			else if (iequals(key, "Help") || key == "?" || iequals(key, "h")) sw = &help;
			else if (iequals(key, "Version")) sw = &version;

			if (sw)
			{
				if (hasInlineValue) return invalid(o, "Switch does not take a value: " + std::string(raw));
				*sw = true;
				continue;
			}

			//---Имя целевого процесса (-TargetProcess <name> | -TargetProcess=<name>)
			if (iequals(key, "TargetProcess"))
			{
				if (haveTarget) return invalid(o, "-TargetProcess may be given only once");

				std::string_view value;
				if (hasInlineValue)
				{
					value = inlineValue;
				}
				else
				{
					if (i + 1 >= argc || argv[i + 1][0] == '-') return invalid(o, "Missing value for -TargetProcess");
					value = argv[++i];
				}

				value = trimView(trimQuotesView(trimView(value)));
				if (value.find(',') != std::string_view::npos)
					return invalid(o, "-TargetProcess accepts a single process name");

				o.request.targetProcess = std::string(value);
				haveTarget = true;
				continue;
			}

			return invalid(o, "Unknown option: " + std::string(raw));
		}

		if (help) o.cmd = Command::Help;
		else if (version) o.cmd = Command::Version;

		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 26)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"deploy-wrapper\n\n"
			"Usage:\n"
			"  deploy-wrapper [-Install | -Uninstall] [-TargetProcess <name>] [-DoNotDisturb] [-ForceInteractive]\n\n"
			"Options:\n";

		printOpt(os, "-Install", "Install the application (default)");
		printOpt(os, "-Uninstall", "Uninstall the application (cannot be combined with -Install)");
		printOpt(os, "-TargetProcess <name>", "Process to check, without extension (single value)");
		printOpt(os, "-DoNotDisturb", "Defer (exit 60012) if the target process is running");
		printOpt(os, "-ForceInteractive", "Use interactive mode even if the target process is not running");
		printOpt(os, "-Version", "Print version and exit");
		printOpt(os, "-Help", "Print this help and exit");

		os <<
			"\nExit codes:\n"
			"  <n>      exit code of the deployment toolkit\n"
			"  1        -Install and -Uninstall given together\n"
			"  2        invalid command line\n"
			"  60012    target process is running and -DoNotDisturb is set (retry later)\n"
			"\nExamples:\n"
			"  deploy-wrapper -Install -TargetProcess outlook\n"
			"  deploy-wrapper -Install -TargetProcess outlook -DoNotDisturb\n"
			"  deploy-wrapper -Uninstall -TargetProcess outlook -ForceInteractive\n";
	}
};//---namespace deploywrap
