#include "deploy_wrapper/ProcessName.hpp"
#include "deploy_wrapper/Strings.hpp"

namespace deploywrap {

	//------------------------------------------------------------
	//	Нормализация имени целевого процесса
	//------------------------------------------------------------
	std::string normalizeProcessName(std::string_view name)
	{
		std::string_view v = trimView(trimQuotesView(trimView(name)));

		if (iendsWith(v, ".exe")) v.remove_suffix(4);

		return std::string(trimView(v));
	}
	//------------------------------------------------------------
	//	Сравнение имени образа с нормализованным именем
	//------------------------------------------------------------
	bool matchesProcessName(std::string_view normalizedName, std::string_view imageName)
	{
		if (normalizedName.empty() || imageName.empty()) return false;

		//---Отбрасываем путь (оба разделителя: образ может прийти из Wine)
		const size_t slash = imageName.find_last_of("/\\");
		if (slash != std::string_view::npos) imageName.remove_prefix(slash + 1);

		if (iequals(imageName, normalizedName)) return true;

		//---Отбрасываем расширение
		const size_t dot = imageName.find_last_of('.');
		if (dot != std::string_view::npos && dot > 0)
		{
			return iequals(imageName.substr(0, dot), normalizedName);
		}
		return false;
	}

	//------------------------------------------------------------
	//	Сравнение с comm процесса Linux
	//------------------------------------------------------------
	bool matchesCommName(std::string_view normalizedName, std::string_view comm, bool allowTruncated)
	{
		if (normalizedName.empty() || comm.empty()) return false;
		if (matchesProcessName(normalizedName, comm)) return true;

		return allowTruncated &&
			normalizedName.size() > kLinuxCommLength &&
			comm.size() == kLinuxCommLength &&
			iequals(normalizedName.substr(0, kLinuxCommLength), comm);
	}

}; //---namespace deploywrap
