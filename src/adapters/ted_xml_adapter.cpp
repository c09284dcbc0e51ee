#include "pnn/adapters/ted_xml_adapter.h"

#include "pnn/classify/notice_classifier.h"
#include "pnn/extract/join.h"
#include "pnn/extract/xml_accessors.h"
#include "pnn/xml/namespace_map.h"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnn::adapters {

namespace {

using record::FieldValue;
using xml::NamespaceMap;

// Lookups against one document, all sharing the namespace map resolved at entry
class TedQuery {
 public:
  TedQuery(const pugi::xml_node& context, const NamespaceMap& ns) : context_(context), ns_(ns) {}

  [[nodiscard]] TedQuery at(const std::string_view path) const {
    return TedQuery(xml::select_first(context_, ns_, path), ns_);
  }

  [[nodiscard]] pugi::xml_node node() const { return context_; }

  [[nodiscard]] FieldValue text(const std::string_view path) const {
    return extract::text(xml::select_first(context_, ns_, path));
  }

  [[nodiscard]] FieldValue attribute(const std::string_view path, const char* name) const {
    return extract::attribute(xml::select_first(context_, ns_, path), name);
  }

  [[nodiscard]] std::vector<pugi::xml_node> all(const std::string_view path) const {
    return xml::select_all(context_, ns_, path);
  }

  // First non-empty attribute value among the paths, tried in order
  [[nodiscard]] FieldValue first_attribute(const std::initializer_list<std::string_view> paths,
                                           const char* name) const {
    for (const std::string_view path : paths) {
      auto value = attribute(path, name);
      if (value.has_value() && !value->empty()) {
        return value;
      }
    }
    return std::nullopt;
  }

 private:
  pugi::xml_node context_;
  const NamespaceMap& ns_;
};

// FORM attribute of the first direct FORM_SECTION child that carries one
FieldValue find_form_type(const TedQuery& doc) {
  const pugi::xml_node form_section = doc.at(".//{ted}FORM_SECTION").node();
  for (const pugi::xml_node& child : form_section.children()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    if (child.attribute("FORM")) {
      return std::string(child.attribute("FORM").value());
    }
  }
  return std::nullopt;
}

}  // namespace

record::NoticeRecord TedXmlAdapter::extract(const pugi::xml_node& root) const {
  const NamespaceMap ns = NamespaceMap::resolve(root);
  const TedQuery doc(root, ns);

  // CPV
  std::vector<std::optional<std::string>> additional_cpvs;
  for (const auto& cpv : doc.all(".//{ted}OBJECT_DESCR/{ted}CPV_ADDITIONAL/{ted}CPV_CODE")) {
    additional_cpvs.push_back(extract::attribute(cpv, "CODE"));
  }

  // NUTS: performance codes from both schema generations, 2016 first
  std::vector<std::optional<std::string>> performance_nuts;
  for (const std::string_view path : {".//{ted}NOTICE_DATA/{n2016}PERFORMANCE_NUTS",
                                      ".//{ted}NOTICE_DATA/{n2021}PERFORMANCE_NUTS"}) {
    for (const auto& nuts : doc.all(path)) {
      performance_nuts.push_back(extract::attribute(nuts, "CODE"));
    }
  }

  // English translation block
  const TedQuery title_doc =
      doc.at(".//{ted}TRANSLATION_SECTION/{ted}ML_TITLES/{ted}ML_TI_DOC[@LG='EN']");

  // Contracting authority
  const TedQuery authority = doc.at(".//{ted}CONTRACTING_BODY/{ted}ADDRESS_CONTRACTING_BODY");

  // Object / description, contract level before lot level
  FieldValue short_descr = doc.text(".//{ted}OBJECT_CONTRACT/{ted}SHORT_DESCR/{ted}P");
  if (!short_descr.has_value()) {
    short_descr = doc.text(".//{ted}OBJECT_DESCR/{ted}SHORT_DESCR/{ted}P");
  }

  // Values
  const TedQuery total = doc.at(".//{ted}OBJECT_CONTRACT/{ted}VAL_TOTAL");
  const TedQuery estimated =
      doc.at(".//{ted}NOTICE_DATA/{ted}VALUES/{ted}VALUE[@TYPE='ESTIMATED_TOTAL']");
  const TedQuery procurement =
      doc.at(".//{ted}NOTICE_DATA/{ted}VALUES/{ted}VALUE[@TYPE='PROCUREMENT_TOTAL']");
  const TedQuery awarded = doc.at(".//{ted}AWARD_CONTRACT/{ted}AWARDED_CONTRACT");
  const TedQuery award_total = awarded.at("{ted}VALUES/{ted}VAL_TOTAL");

  // Winning contractors
  std::vector<std::optional<std::string>> contractor_names;
  for (const auto& contractor :
       doc.all(".//{ted}AWARD_CONTRACT/{ted}AWARDED_CONTRACT/{ted}CONTRACTORS/{ted}CONTRACTOR")) {
    contractor_names.push_back(
        TedQuery(contractor, ns).text("{ted}ADDRESS_CONTRACTOR/{ted}OFFICIALNAME"));
  }

  // Codified data
  const TedQuery codif = doc.at(".//{ted}CODIF_DATA");
  const FieldValue td_document_type = codif.attribute("{ted}TD_DOCUMENT_TYPE", "CODE");

  const FieldValue form_type = ns.is_resolved(xml::Namespace::kTed) ? find_form_type(doc)
                                                                     : std::nullopt;
  const auto notice_type_group = classify::classify_ted_document_type(td_document_type);

  record::NoticeRecord rec;
  rec.set("schema_type", schema_type());
  rec.set("form_type", form_type);

  rec.set("td_document_type_code", td_document_type);
  rec.set("notice_type_group", classify::notice_type_group_to_string(notice_type_group));

  rec.set("doc_id", extract::attribute(root, "DOC_ID"));
  rec.set("edition", extract::attribute(root, "EDITION"));
  rec.set("no_doc_ojs", doc.text(".//{ted}NOTICE_DATA/{ted}NO_DOC_OJS"));
  rec.set("notice_url", doc.text(".//{ted}NOTICE_DATA/{ted}URI_LIST/{ted}URI_DOC[@LG='EN']"));

  rec.set("date_pub", doc.text(".//{ted}REF_OJS/{ted}DATE_PUB"));
  rec.set("ds_date_dispatch", codif.text("{ted}DS_DATE_DISPATCH"));
  rec.set("award_date", awarded.text("{ted}DATE_CONCLUSION_CONTRACT"));

  rec.set("iso_country", doc.attribute(".//{ted}NOTICE_DATA/{ted}ISO_COUNTRY", "VALUE"));
  rec.set("ti_country", title_doc.text("{ted}TI_CY"));
  rec.set("ti_town", title_doc.text("{ted}TI_TOWN"));
  rec.set("ca_country_code", authority.attribute("{ted}COUNTRY", "VALUE"));
  rec.set("ca_town", authority.text("{ted}TOWN"));
  rec.set("ca_postcode", authority.text("{ted}POSTAL_CODE"));
  rec.set("ca_nuts_code", authority.first_attribute({"{n2016}NUTS", "{n2021}NUTS"}, "CODE"));
  rec.set("perf_nuts_code", extract::join_sorted_xml(performance_nuts));
  rec.set("ca_ce_nuts_code", doc.first_attribute({".//{ted}NOTICE_DATA/{n2016}CA_CE_NUTS",
                                                  ".//{ted}NOTICE_DATA/{n2021}CA_CE_NUTS"},
                                                 "CODE"));

  rec.set("ca_name", authority.text("{ted}OFFICIALNAME"));
  rec.set("ca_email", authority.text("{ted}E_MAIL"));
  rec.set("ca_url", authority.text("{ted}URL_GENERAL"));

  rec.set("original_cpv_code", doc.attribute(".//{ted}NOTICE_DATA/{ted}ORIGINAL_CPV", "CODE"));
  rec.set("cpv_main_code",
          doc.attribute(".//{ted}OBJECT_CONTRACT/{ted}CPV_MAIN/{ted}CPV_CODE", "CODE"));
  rec.set("additional_cpv_codes", extract::join_sorted_xml(additional_cpvs));

  rec.set("ti_text", title_doc.text("{ted}TI_TEXT/{ted}P"));
  rec.set("obj_title", doc.text(".//{ted}OBJECT_CONTRACT/{ted}TITLE/{ted}P"));
  rec.set("short_descr", short_descr);
  rec.set("type_contract_ctype",
          doc.attribute(".//{ted}OBJECT_CONTRACT/{ted}TYPE_CONTRACT", "CTYPE"));

  rec.set("val_total", extract::text(total.node()));
  rec.set("val_total_currency", extract::attribute(total.node(), "CURRENCY"));
  rec.set("est_total_val", extract::text(estimated.node()));
  rec.set("est_total_val_currency", extract::attribute(estimated.node(), "CURRENCY"));
  rec.set("proc_total_val", extract::text(procurement.node()));
  rec.set("proc_total_val_currency", extract::attribute(procurement.node(), "CURRENCY"));
  rec.set("aw_val_total", extract::text(award_total.node()));
  rec.set("aw_val_currency", extract::attribute(award_total.node(), "CURRENCY"));
  rec.set("nb_tenders", awarded.text("{ted}TENDERS/{ted}NB_TENDERS_RECEIVED"));

  rec.set("nc_contract_nature_code", codif.attribute("{ted}NC_CONTRACT_NATURE", "CODE"));
  rec.set("pr_proc_code", codif.attribute("{ted}PR_PROC", "CODE"));
  rec.set("ac_award_crit_code", codif.attribute("{ted}AC_AWARD_CRIT", "CODE"));
  rec.set("ma_main_activities_code", codif.attribute("{ted}MA_MAIN_ACTIVITIES", "CODE"));
  rec.set("rp_regulation_code", codif.attribute("{ted}RP_REGULATION", "CODE"));

  rec.set("contractor_names", extract::join_sorted_xml(contractor_names));

  return rec;
}

}  // namespace pnn::adapters
