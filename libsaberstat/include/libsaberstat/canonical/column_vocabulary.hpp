#pragma once

#include "libsaberstat/utils/string_utils.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace canonical {

enum class FieldKind {
	/// Entity identifiers (school, municipality, department)
	Identifier,
	/// Numeric subject score
	Subject,
	/// Categorical attribute (school type, area, strata, ...)
	Categorical,
	/// record_id, year, period, grade: parsed into dedicated StudentRecord members
	Derived
};

struct CanonicalField {
	std::string name;
	FieldKind kind = FieldKind::Categorical;
	/// Source column names, in priority order (first alias present in a batch wins)
	std::vector<std::string> aliases;
};

/// Column resolution for one batch column
struct ResolvedColumn {
	size_t field_index = 0;
	size_t alias_rank = 0;
};

/**
 * Case-insensitive mapping from source column names to canonical fields
 *
 * The default vocabulary covers the SABER 3/5/9/11 data dictionaries across
 * the column renames between exam years (e.g. COD_DANE vs
 * COLE_COD_DANE_ESTABLECIMIENTO). Callers can add fields or aliases for
 * other sources.
 */
class ColumnVocabulary {
public:
	static ColumnVocabulary Default();

	/**
	 * Register a canonical field; the canonical name is also an alias of itself
	 *
	 * @throws std::invalid_argument if the name or one of the aliases is already registered
	 */
	void AddField(const std::string &name, FieldKind kind, const std::vector<std::string> &aliases = {});

	/// @throws std::invalid_argument for unknown fields or aliases already mapped to another field
	void AddAlias(const std::string &name, const std::string &alias);

	/// Resolve a source column (trimmed, any case) to a canonical field
	std::optional<ResolvedColumn> Resolve(const std::string &column) const;

	const CanonicalField *Find(const std::string &name) const;

	const std::vector<CanonicalField> &Fields() const {
		return fields_;
	}

	/// Canonical subject names in registration order
	std::vector<std::string> Subjects() const;

private:
	std::vector<CanonicalField> fields_;
	std::map<std::string, ResolvedColumn> alias_index_;

	void IndexAlias(size_t field_index, const std::string &alias, size_t rank);
};

/// Canonical subjects of the SABER 11 exam, with the global score last
inline std::vector<std::string> DefaultSubjects() {
	return {"lectura_critica", "matematicas", "c_naturales", "sociales_ciudadanas", "ingles", "global"};
}

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline ColumnVocabulary ColumnVocabulary::Default() {
	ColumnVocabulary vocab;

	vocab.AddField("record_id", FieldKind::Derived, {"ESTU_CONSECUTIVO"});
	vocab.AddField("year", FieldKind::Derived, {"YEAR", "ANO"});
	vocab.AddField("period", FieldKind::Derived, {"PERIODO"});
	vocab.AddField("grade", FieldKind::Derived, {"GRADO", "GRADE"});

	vocab.AddField("school_id", FieldKind::Identifier, {"COLE_COD_DANE_ESTABLECIMIENTO", "COD_DANE", "CODIGO"});
	vocab.AddField("school_name", FieldKind::Identifier, {"COLE_NOMBRE_ESTABLECIMIENTO"});
	vocab.AddField("municipality_id", FieldKind::Identifier,
	               {"COLE_COD_MCPIO_UBICACION", "MUNI_ID", "COLE_MCPIO_UBICACION"});
	vocab.AddField("department_id", FieldKind::Identifier, {"COLE_COD_DEPTO_UBICACION", "COLE_DEPTO_UBICACION"});

	vocab.AddField("lectura_critica", FieldKind::Subject, {"PUNT_LECTURA_CRITICA"});
	vocab.AddField("matematicas", FieldKind::Subject, {"PUNT_MATEMATICAS"});
	vocab.AddField("c_naturales", FieldKind::Subject, {"PUNT_C_NATURALES"});
	vocab.AddField("sociales_ciudadanas", FieldKind::Subject, {"PUNT_SOCIALES_CIUDADANAS"});
	vocab.AddField("ingles", FieldKind::Subject, {"PUNT_INGLES"});
	vocab.AddField("global", FieldKind::Subject, {"PUNT_GLOBAL"});

	for (const char *name : {"cole_genero", "cole_naturaleza", "cole_caracter", "cole_area_ubicacion",
	                         "cole_jornada", "estu_genero", "estu_etnia", "fami_estratovivienda",
	                         "fami_educacionmadre", "fami_educacionpadre", "fami_tieneinternet",
	                         "fami_tienecomputador"}) {
		vocab.AddField(name, FieldKind::Categorical);
	}

	return vocab;
}

inline void ColumnVocabulary::AddField(const std::string &name, FieldKind kind,
                                       const std::vector<std::string> &aliases) {
	if (Find(name) != nullptr) {
		throw std::invalid_argument("Canonical field already registered: '" + name + "'");
	}
	CanonicalField field;
	field.name = name;
	field.kind = kind;
	field.aliases = aliases;
	field.aliases.push_back(name);
	fields_.push_back(field);

	const size_t index = fields_.size() - 1;
	for (size_t rank = 0; rank < fields_[index].aliases.size(); rank++) {
		IndexAlias(index, fields_[index].aliases[rank], rank);
	}
}

inline void ColumnVocabulary::AddAlias(const std::string &name, const std::string &alias) {
	for (size_t i = 0; i < fields_.size(); i++) {
		if (fields_[i].name == name) {
			fields_[i].aliases.push_back(alias);
			IndexAlias(i, alias, fields_[i].aliases.size() - 1);
			return;
		}
	}
	throw std::invalid_argument("Cannot add alias '" + alias + "': unknown canonical field '" + name + "'");
}

inline void ColumnVocabulary::IndexAlias(size_t field_index, const std::string &alias, size_t rank) {
	const std::string key = utils::ToUpper(utils::Trim(alias));
	auto it = alias_index_.find(key);
	if (it != alias_index_.end()) {
		if (it->second.field_index == field_index) {
			return;
		}
		throw std::invalid_argument("Column alias '" + alias + "' is already mapped to field '" +
		                            fields_[it->second.field_index].name + "'");
	}
	alias_index_[key] = ResolvedColumn {field_index, rank};
}

inline std::optional<ResolvedColumn> ColumnVocabulary::Resolve(const std::string &column) const {
	auto it = alias_index_.find(utils::ToUpper(utils::Trim(column)));
	if (it == alias_index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

inline const CanonicalField *ColumnVocabulary::Find(const std::string &name) const {
	for (const auto &field : fields_) {
		if (field.name == name) {
			return &field;
		}
	}
	return nullptr;
}

inline std::vector<std::string> ColumnVocabulary::Subjects() const {
	std::vector<std::string> subjects;
	for (const auto &field : fields_) {
		if (field.kind == FieldKind::Subject) {
			subjects.push_back(field.name);
		}
	}
	return subjects;
}

} // namespace canonical
} // namespace libsaberstat
